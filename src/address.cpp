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

#include <regex>

#include "ilinebot.h"
#include "address.h"

namespace
{
	const std::regex::flag_type RegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

	const std::regex& WebGatewayRegex()
	{
		static const std::regex regex("^.+\\.mibbit\\.com$", RegexFlags);
		return regex;
	}

	const std::regex& HexHostRegex()
	{
		static const std::regex regex("^[~+\\-^=]?[a-f0-9]{8}$", RegexFlags);
		return regex;
	}

	const std::regex& HostnameRegex()
	{
		static const std::regex regex("^.+\\.[a-z]+$", RegexFlags);
		return regex;
	}

	const std::regex& AddressRegex()
	{
		static const std::regex regex("^[a-f0-9.:]{3,45}$", RegexFlags);
		return regex;
	}
}

bool Address::IsWebGatewayHost(const std::string& host)
{
	return std::regex_match(host, WebGatewayRegex());
}

bool Address::IsHexHost(const std::string& str)
{
	return std::regex_match(str, HexHostRegex());
}

bool Address::IsHostname(const std::string& str)
{
	return std::regex_match(str, HostnameRegex());
}

bool Address::IsAddress(const std::string& str)
{
	// Short hex words like "deaf" would otherwise look like addresses.
	if (str.find_first_of(".:") == std::string::npos)
		return false;

	return std::regex_match(str, AddressRegex()) && !IsHostname(str);
}

std::string Address::HexToIPv4(const std::string& str)
{
	if (!IsHexHost(str))
		return {};

	const std::string hex = str.substr(str.length() - 8);
	std::string ip;
	for (size_t pos = 0; pos < hex.length(); pos += 2)
	{
		unsigned int octet = 0;
		std::from_chars(hex.data() + pos, hex.data() + pos + 2, octet, 16);
		if (!ip.empty())
			ip.push_back('.');
		ip.append(fmt::to_string(octet));
	}
	return ip;
}
