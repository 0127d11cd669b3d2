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

#pragma once

/** Heuristics for recognising the addresses and hosts which appear in
 * IRC user masks. These are not RFC exact; they err on the side of not
 * recognising something rather than misrecognising it.
 */
namespace Address
{
	/** Determines whether a host belongs to a known web chat gateway.
	 * @param host The host to check.
	 */
	CoreExport bool IsWebGatewayHost(const std::string& host);

	/** Determines whether a string is an eight digit hex encoded IPv4
	 * address with an optional ident prefix character (e.g. ~c0a80001).
	 * @param str The string to check.
	 */
	CoreExport bool IsHexHost(const std::string& str);

	/** Determines whether a string ends in an alphabetic domain label.
	 * @param str The string to check.
	 */
	CoreExport bool IsHostname(const std::string& str);

	/** Determines whether a string looks like an IPv4 or IPv6 address.
	 * @param str The string to check.
	 */
	CoreExport bool IsAddress(const std::string& str);

	/** Decodes a hex encoded IPv4 address to dotted decimal.
	 * @param str The hex encoded address, optionally with an ident prefix character.
	 * @return The decoded address or an empty string if str was not a hex host.
	 */
	CoreExport std::string HexToIPv4(const std::string& str);
}
