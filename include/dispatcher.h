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

/** Turns channel messages into lookups. It decides whether a message is a
 * command the bot should answer, works out which address to look up, and
 * hands the lookup to the executor or the STATS L correlator.
 */
class CoreExport CommandDispatcher final
{
private:
	/** The networks which replies are delivered through. */
	LinkManager& links;

	/** The request which is currently in progress. */
	RequestSlot slot;

	/** Limits how many commands are accepted. */
	FloodController flood;

	/** Fetches results from the lookup service. */
	LookupExecutor executor;

	/** Finds addresses with STATS L. */
	StatsCorrelator correlator;

	/** Handles the lookup command. */
	void Lookup(const std::shared_ptr<const LookupSettings>& settings, Transport& link, const std::string& channel,
		const std::string& nick, const std::string& userhost, const std::string& argument, Invocation invocation);

	/** Looks up the address of the requester from their user\@host. */
	void LookupSelf(const LookupSettings& settings, Transport& link, const std::string& channel,
		const std::string& nick, const std::string& userhost);

	/** Sends a "Looking up" notice unless notices are hidden. */
	void SendLooking(const LookupSettings& settings, Transport& link, const std::string& channel,
		const std::string& nick, unsigned int flags, const std::string& what);

public:
	CommandDispatcher(LinkManager& Links);

	/** Processes a message which was sent to a channel.
	 * @param settings The settings to process the message under.
	 * @param link The network the message was received on.
	 * @param channel The channel the message was sent to.
	 * @param nick The nickname of the sender.
	 * @param userhost The user\@host of the sender.
	 * @param text The text of the message.
	 * @param invocation Whether this is a new message or a continued lookup.
	 */
	void Process(const std::shared_ptr<const LookupSettings>& settings, Transport& link, const std::string& channel,
		const std::string& nick, const std::string& userhost, const std::string& text, Invocation invocation = Invocation::TOP_LEVEL);

	/** Processes a numeric which was received from a server.
	 * @param link The network the numeric was received on.
	 * @param numeric The numeric which was received.
	 * @param params The parameters of the numeric.
	 * @return True if the numeric was consumed; otherwise, false.
	 */
	bool OnNumeric(Transport& link, unsigned int numeric, const std::vector<std::string>& params);

	const RequestSlot& GetSlot() const { return slot; }
	FloodController& GetFlood() { return flood; }
	LookupExecutor& GetExecutor() { return executor; }
	StatsCorrelator& GetCorrelator() { return correlator; }
};
