/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013-2014, 2016 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2013, 2018-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2007-2008 Robin Burchell <robin+git@viroteck.net>
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

class IRCLink;

/** The state of a channel which the bot is a member of. */
class CoreExport IRCChannel final
{
public:
	typedef std::map<std::string, MemberInfo, irc::insensitive_swo> MemberMap;

	/** The name of the channel as the server sent it. */
	std::string name;

	/** The members of the channel. */
	MemberMap members;

	/** Whether the WHO reply for the channel has been received. */
	bool synced = false;

	IRCChannel(const std::string& Name)
		: name(Name)
	{
	}
};

/** Sends a PING to the network every pinginterval seconds to measure lag. */
class CoreExport LinkPingTimer final
	: public Timer
{
private:
	/** The link which is being pinged. */
	IRCLink& link;

public:
	LinkPingTimer(IRCLink& Link)
		: Timer(30, true)
		, link(Link)
	{
	}

	/** @copydoc Timer::Tick */
	bool Tick() override;
};

/** Reconnects a link after it has been disconnected. */
class CoreExport LinkReconnectTimer final
	: public Timer
{
private:
	/** The link which is being reconnected. */
	IRCLink& link;

public:
	LinkReconnectTimer(IRCLink& Link)
		: Timer(60, false)
		, link(Link)
	{
	}

	/** @copydoc Timer::Tick */
	bool Tick() override;
};

/** A client connection to an IRC network which has been configured in a \<link> tag. */
class CoreExport IRCLink final
	: public BufferedSocket
	, public Transport
{
public:
	typedef std::map<std::string, IRCChannel, irc::insensitive_swo> ChannelMap;

private:
	/** The name of the network as given in the \<link> tag. */
	const std::string tag;

	/** The address of the server to connect to. */
	std::string address;

	/** The port of the server to connect to. */
	unsigned int port;

	/** If non-empty then the password to send when registering. */
	std::string password;

	/** The nickname to try first when registering. */
	std::string confignick;

	/** The username to register with. */
	std::string user;

	/** The real name to register with. */
	std::string realname;

	/** The number of seconds to wait for a connection. */
	unsigned long timeout;

	/** The number of seconds to wait before reconnecting. */
	unsigned long reconnect;

	/** The number of seconds between lag checks. */
	unsigned long pinginterval;

	/** The nickname the bot currently has on this network. */
	std::string nick;

	/** Whether the server has accepted the registration. */
	bool registered = false;

	/** The channel status modes from the PREFIX token (e.g. ov). */
	std::string prefixmodes = "ov";

	/** The channel status prefixes from the PREFIX token (e.g. @+). */
	std::string prefixchars = "@+";

	/** The channel modes which take a parameter when set and unset (groups A and B of CHANMODES). */
	std::string parammodes = "beIk";

	/** The channel modes which only take a parameter when set (group C of CHANMODES). */
	std::string setparammodes = "l";

	/** The channels the bot is in. */
	ChannelMap channels;

	/** The round trip time of the last PING in milliseconds. */
	unsigned long lag = 0;

	/** If non-zero then the time in milliseconds at which an unanswered PING was sent. */
	unsigned long long pingsent = 0;

	/** Sends a lag check to the network. */
	LinkPingTimer pingtimer;

	/** Reconnects to the network after it has been lost. */
	LinkReconnectTimer reconnecttimer;

	/** Splits a message from the server into its components. */
	static bool Split(const std::string& line, std::string& prefix, std::string& command, std::vector<std::string>& params);

	/** Handles a single line from the server. */
	void ProcessLine(const std::string& line);

	/** Handles a numeric from the server. */
	void OnNumeric(unsigned int numeric, const std::vector<std::string>& params);

	/** Handles a RPL_ISUPPORT numeric. */
	void OnISupport(const std::vector<std::string>& params);

	/** Handles a RPL_NAMREPLY numeric. */
	void OnNames(const std::vector<std::string>& params);

	/** Handles a RPL_WHOREPLY numeric. */
	void OnWho(const std::vector<std::string>& params);

	/** Handles a MODE message for a channel. */
	void OnChannelMode(IRCChannel& chan, const std::vector<std::string>& params);

	/** Handles a PRIVMSG message. */
	void OnPrivmsg(const std::string& source, const std::vector<std::string>& params);

	/** Applies a status mode change to a member. */
	static void SetStatus(MemberInfo& member, char mode, bool adding);

	/** Schedules a reconnect and forgets all channel state. */
	void Disconnected();

public:
	/** Creates a new link from a \<link> tag and registers it with the link manager. */
	IRCLink(const std::shared_ptr<ConfigTag>& config);
	~IRCLink() override;

	/** Reads the connection settings from a \<link> tag. The name is never changed. */
	void Configure(const std::shared_ptr<ConfigTag>& config);

	/** Starts connecting to the network if not already connected. */
	void Connect();

	/** Joins the monitored channels for this network and parts the ones which are no longer monitored. */
	void JoinChannels();

	/** Sends a PING to the network.
	 * @return False if the network has stopped answering; otherwise, true.
	 */
	bool Ping();

	/** Sends QUIT to the network and closes the connection. */
	void Quit(const std::string& reason);

	/** Writes a raw line to the network. */
	void SendLine(const std::string& line);

	/** Retrieves the channels the bot is in on this network. */
	const ChannelMap& GetChannels() const { return channels; }

	/** Determines whether the server has accepted the registration. */
	bool IsRegistered() const { return registered; }

	/** @copydoc Transport::GetTag */
	const std::string& GetTag() const override { return tag; }

	/** @copydoc Transport::GetNick */
	const std::string& GetNick() const override { return nick; }

	/** @copydoc Transport::GetLag */
	unsigned long GetLag() const override;

	/** @copydoc Transport::IsSynced */
	bool IsSynced(const std::string& channel) const override;

	/** @copydoc Transport::IsJoined */
	bool IsJoined(const std::string& channel) const override;

	/** @copydoc Transport::FindMember */
	std::optional<MemberInfo> FindMember(const std::string& channel, const std::string& member) const override;

	/** @copydoc Transport::SendChannel */
	void SendChannel(const std::string& channel, const std::string& text) override;

	/** @copydoc Transport::SendStatsQuery */
	void SendStatsQuery(char type, const std::string& target) override;

	/** @copydoc BufferedSocket::OnConnected */
	void OnConnected() override;

	/** @copydoc BufferedSocket::OnDataReady */
	void OnDataReady() override;

	/** @copydoc BufferedSocket::OnError */
	void OnError(BufferedSocketError e) override;
};
