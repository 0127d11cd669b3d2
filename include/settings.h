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

/** An immutable snapshot of the \<iline> configuration. A new snapshot is
 * built every time the config is read and each request keeps the snapshot
 * it was accepted under until it finishes.
 */
class CoreExport LookupSettings final
{
public:
	/** The channels to answer in, each in the form network/#channel. */
	std::vector<std::string> Channels;

	/** The name of the lookup command (e.g. Iline). */
	std::string Command;

	/** The prefix which commands must start with. */
	std::string CommandChar;

	/** The lookup service URL which the address is appended to. */
	std::string URL;

	/** The maximum lag in seconds before requests are ignored or 0 to disable. */
	unsigned long LagLimit;

	/** The length in seconds of the flood control window. */
	unsigned long FloodTimeout;

	/** The number of commands accepted per flood control window. */
	unsigned long FloodCount;

	/** The number of seconds to wait for a STATS L reply. */
	unsigned long StatsTimeout;

	/** The number of seconds the lookup worker may spend fetching a reply. */
	unsigned long FetchTimeout;

	/** Whether the bot must have op, halfop, or voice to answer. */
	bool RequirePrivs;

	/** Whether to prefix replies with the command name. */
	bool ShowIline;

	/** Whether to answer the help command. */
	bool CommandHelp;

	/** Whether to answer the version command. */
	bool CommandVersion;

	/** Whether to decode web gateway idents into addresses. */
	bool TestWebchat;

	/** Whether reply labels use their long form. */
	bool ShowPrefixLong;

	/** Whether to prefix replies with their labels. */
	bool ShowPrefix;

	/** Whether to include the identity and URL in replies. */
	bool ShowExtended;

	/** Whether to suppress the "Processing..." reply. */
	bool HideProcessing;

	/** Whether to suppress every "Looking up" reply. */
	bool HideLooking;

	/** Whether to suppress the "Looking up" reply for nicknames. */
	bool HideLookingNicks;

	/** Reads the settings from an \<iline> tag. Settings which are not
	 * specified in the tag are set to a default value.
	 * @param tag Configuration tag to read the settings from.
	 */
	LookupSettings(const std::shared_ptr<ConfigTag>& tag);

	/** Determines whether a channel on a network is monitored.
	 * @param network The tag of the network the channel is on.
	 * @param channel The name of the channel.
	 */
	bool IsMonitored(const std::string& network, const std::string& channel) const;

	/** Retrieves the monitored channels on a network. */
	std::vector<std::string> GetChannels(const std::string& network) const;
};
