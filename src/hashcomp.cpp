/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013, 2015-2016, 2018-2023 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2009 Daniel De Graaf <danieldg@inspircd.org>
 *   Copyright (C) 2005-2009 Craig Edwards <brain@inspircd.org>
 *
 * This file is part of IlineBot.  IlineBot is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General Public
 * License as published by the Free Software Foundation, version 2.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */



#include "ilinebot.h"

bool irc::equals(std::string_view s1, std::string_view s2)
{
	return std::ranges::equal(s1, s2, [](unsigned char c1, unsigned char c2) {
		return irc::tolower(c1) == irc::tolower(c2);
	});
}

bool irc::insensitive_swo::operator()(const std::string& a, const std::string& b) const
{
	return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char c1, unsigned char c2) {
		return irc::tolower(c1) < irc::tolower(c2);
	});
}

irc::sepstream::sepstream(const std::string& source, char separator, bool allowempty)
	: tokens(source)
	, sep(separator)
	, allow_empty(allowempty)
{
}

bool irc::sepstream::GetToken(std::string& token)
{
	token.clear();
	if (!allow_empty && pos < tokens.length())
		pos = std::min(tokens.find_first_not_of(sep, pos), tokens.length() + 1);

	// pos is one past the end once the final token has been read.
	if (pos > tokens.length() || (!allow_empty && pos == tokens.length()))
		return false;

	const size_t end = std::min(tokens.find(sep, pos), tokens.length());
	token.assign(tokens, pos, end - pos);
	pos = end + 1;
	return true;
}

irc::tokenstream::tokenstream(const std::string& msg)
	: message(msg)
{
}

bool irc::tokenstream::GetMiddle(std::string& token)
{
	token.clear();
	if (position >= message.length())
		return false;

	const size_t end = std::min(message.find(' ', position), message.length());
	token.assign(message, position, end - position);
	position = std::min(message.find_first_not_of(' ', end), message.length());
	return true;
}

bool irc::tokenstream::GetTrailing(std::string& token)
{
	if (position < message.length() && message[position] == ':')
	{
		token.assign(message, position + 1);
		position = message.length();
		return true;
	}
	return GetMiddle(token);
}
