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

/** Information about a member of a channel as seen by a transport. */
class CoreExport MemberInfo final
{
public:
	/** The nickname of the member. */
	std::string nick;

	/** The username (ident) of the member. */
	std::string user;

	/** The hostname or address of the member. */
	std::string host;

	/** Whether the member has channel operator status. */
	bool op = false;

	/** Whether the member has half-operator status. */
	bool halfop = false;

	/** Whether the member has voice status. */
	bool voice = false;

	/** Retrieves the user\@host of the member. */
	std::string GetUserHost() const { return user + "@" + host; }

	/** Determines whether the member has any status in the channel. */
	bool HasStatus() const { return op || halfop || voice; }
};

/** A connection to a single IRC network which the lookup pipeline can
 * read channel state from and send messages through.
 */
class CoreExport Transport
{
public:
	virtual ~Transport() = default;

	/** Retrieves the tag which identifies this network (e.g. IRCnet). */
	virtual const std::string& GetTag() const = 0;

	/** Retrieves the nickname the bot is using on this network. */
	virtual const std::string& GetNick() const = 0;

	/** Retrieves the last measured round trip time to the server in milliseconds. */
	virtual unsigned long GetLag() const = 0;

	/** Determines whether the bot is in a channel and has received its full member list.
	 * @param channel The name of the channel.
	 */
	virtual bool IsSynced(const std::string& channel) const = 0;

	/** Determines whether the bot is in a channel.
	 * @param channel The name of the channel.
	 */
	virtual bool IsJoined(const std::string& channel) const = 0;

	/** Looks up a member of a channel.
	 * @param channel The name of the channel.
	 * @param nick The nickname of the member.
	 * @return The member information or std::nullopt if they are not in the channel.
	 */
	virtual std::optional<MemberInfo> FindMember(const std::string& channel, const std::string& nick) const = 0;

	/** Sends a message to a channel.
	 * @param channel The name of the channel.
	 * @param text The message to send.
	 */
	virtual void SendChannel(const std::string& channel, const std::string& text) = 0;

	/** Sends a STATS query to the server.
	 * @param type The type of STATS query (e.g. L).
	 * @param target The target of the query.
	 */
	virtual void SendStatsQuery(char type, const std::string& target) = 0;
};

/** Keeps track of the networks the bot is connected to by their tag. Work
 * which outlives the message that caused it stores the tag and looks the
 * network up again here when it completes.
 */
class CoreExport LinkManager final
{
public:
	typedef std::map<std::string, Transport*, irc::insensitive_swo> LinkMap;

private:
	/** The networks which are currently known keyed by their tag. */
	LinkMap links;

public:
	/** Registers a network.
	 * @param link The network to register.
	 * @return True if the network was registered or false if the tag is in use.
	 */
	bool Add(Transport* link) ATTR_NOT_NULL(2);

	/** Unregisters a network. */
	void Del(Transport* link) ATTR_NOT_NULL(2);

	/** Finds a network by its tag.
	 * @param tag The tag of the network.
	 * @return The network or nullptr if no network has that tag.
	 */
	Transport* Find(const std::string& tag) const;

	/** Retrieves all registered networks. */
	const LinkMap& GetLinks() const { return links; }
};
