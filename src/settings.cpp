/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
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

LookupSettings::LookupSettings(const std::shared_ptr<ConfigTag>& tag)
	: Command(tag->getString("command", "Iline", 1))
	, CommandChar(tag->getString("commandchar", "!", 1))
	, URL(tag->getString("url", "https://api.i-line.space/index.php?q=", 1))
	, LagLimit(tag->getDuration("laglimit", 5))
	, FloodTimeout(tag->getDuration("floodtimeout", 60))
	, FloodCount(tag->getNum<unsigned long>("floodcount", 5))
	, StatsTimeout(tag->getDuration("statstimeout", 30, 1))
	, FetchTimeout(tag->getDuration("fetchtimeout", 20, 1))
	, RequirePrivs(tag->getBool("requireprivs", true))
	, ShowIline(tag->getBool("showiline", true))
	, CommandHelp(tag->getBool("commandhelp", true))
	, CommandVersion(tag->getBool("commandversion", true))
	, TestWebchat(tag->getBool("testwebchat", true))
	, ShowPrefixLong(tag->getBool("showprefixlong", true))
	, ShowPrefix(tag->getBool("showprefix", true))
	, ShowExtended(tag->getBool("showextended", true))
	, HideProcessing(tag->getBool("hideprocessing", false))
	, HideLooking(tag->getBool("hidelooking", false))
	, HideLookingNicks(tag->getBool("hidelookingnicks", false))
{
	// A zero flood window or count means "use the default".
	if (!FloodTimeout)
		FloodTimeout = 60;
	if (!FloodCount)
		FloodCount = 5;

	irc::commasepstream channelstream(tag->getString("channels"));
	for (std::string channel; channelstream.GetToken(channel); )
	{
		channel = iline::trim(channel);
		if (channel.empty())
			continue;

		if (channel.find('/') == std::string::npos)
		{
			tag->LogMalformed("channels", channel, "(skipped)", "not in the network/#channel format");
			continue;
		}
		Channels.push_back(channel);
	}
}

bool LookupSettings::IsMonitored(const std::string& network, const std::string& channel) const
{
	const std::string wanted = network + "/" + channel;
	return std::any_of(Channels.begin(), Channels.end(), [&wanted](const std::string& entry) {
		return irc::equals(entry, wanted);
	});
}

std::vector<std::string> LookupSettings::GetChannels(const std::string& network) const
{
	std::vector<std::string> channels;
	for (const auto& entry : Channels)
	{
		const size_t slash = entry.find('/');
		if (irc::equals(std::string_view(entry).substr(0, slash), network))
			channels.push_back(entry.substr(slash + 1));
	}
	return channels;
}
