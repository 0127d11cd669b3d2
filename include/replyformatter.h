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

/** Flags which describe where an address came from and what happened to a
 * reply before it was sent. Labels are shown in the order declared here.
 */
enum ReplyFlag
	: unsigned int
{
	/** The address was given as a command argument. */
	RF_ARGUMENT = 1,

	/** The address was decoded from a web chat gateway ident. */
	RF_WEBCHAT = 2,

	/** The address was the public host of the requester. */
	RF_PUBLIC = 4,

	/** The address came from a STATS L reply. */
	RF_STATSL = 8,

	/** The lookup was made on behalf of another nickname. */
	RF_NICK = 16,

	/** The text came from the lookup service. */
	RF_REPLY = 32,

	/** The text describes an error. */
	RF_ERROR = 64,

	/** The text was too long and has been truncated. */
	RF_TRUNCATED = 128,

	/** The text contained unsafe characters which have been removed. */
	RF_GARBAGE = 256
};

namespace Reply
{
	/** Builds the label section for a set of reply flags.
	 * @param flags The reply flags to describe.
	 * @param longform Whether to use the long form of each label.
	 * @return The space separated labels or an empty string if no flags are set.
	 */
	CoreExport std::string Labels(unsigned int flags, bool longform);

	/** Formats a reply to a channel member.
	 * @param settings The settings to format with.
	 * @param nick The nickname the reply is addressed to.
	 * @param flags The reply flags.
	 * @param body The text of the reply.
	 */
	CoreExport std::string Format(const LookupSettings& settings, const std::string& nick, unsigned int flags, const std::string& body);

	/** Formats a reply and sends it to a channel.
	 * @param settings The settings to format with.
	 * @param link The network to send through.
	 * @param channel The channel to send to.
	 * @param nick The nickname the reply is addressed to.
	 * @param flags The reply flags.
	 * @param body The text of the reply.
	 */
	CoreExport void Send(const LookupSettings& settings, Transport& link, const std::string& channel, const std::string& nick, unsigned int flags, const std::string& body);
}
