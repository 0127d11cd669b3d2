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


#include "ilinebot.h"

namespace
{
	/** The maximum amount of unterminated data which will be buffered. */
	constexpr size_t MAX_RECVQ = 16384;

	unsigned long long NowMsec()
	{
		return static_cast<unsigned long long>(BotInstance->Time()) * 1000 + (BotInstance->Time_ns() / 1000000);
	}

	/** Splits a nick!user\@host source into its nickname and user\@host. */
	void SplitSource(const std::string& source, std::string& nick, std::string& user, std::string& host)
	{
		const size_t bang = source.find('!');
		nick.assign(source, 0, bang);
		if (bang == std::string::npos)
			return;

		const size_t at = source.find('@', bang);
		if (at == std::string::npos)
		{
			user.assign(source, bang + 1);
			return;
		}

		user.assign(source, bang + 1, at - bang - 1);
		host.assign(source, at + 1);
	}
}

bool LinkPingTimer::Tick()
{
	return link.Ping();
}

bool LinkReconnectTimer::Tick()
{
	link.Connect();
	return false;
}

IRCLink::IRCLink(const std::shared_ptr<ConfigTag>& config)
	: tag(config->getString("name"))
	, pingtimer(*this)
	, reconnecttimer(*this)
{
	Configure(config);
	if (!BotInstance->Links.Add(this))
		throw CoreException("A link called " + tag + " already exists!");
}

IRCLink::~IRCLink()
{
	BotInstance->Links.Del(this);
}

void IRCLink::Configure(const std::shared_ptr<ConfigTag>& config)
{
	address = config->getString("address");
	port = config->getNum<unsigned int>("port", 6667, 1, 65535);
	password = config->getString("password");
	confignick = config->getString("nick", "IlineBot", 1);
	user = config->getString("user", "iline", 1);
	realname = config->getString("realname", ILINEBOT_SERVICE " I-line lookup bot", 1);
	timeout = config->getDuration("timeout", 30, 1);
	reconnect = config->getDuration("reconnect", 60, 1);
	pinginterval = config->getDuration("pinginterval", 30, 1);

	pingtimer.SetInterval(pinginterval, registered);
	reconnecttimer.SetInterval(reconnect, false);
}

void IRCLink::Connect()
{
	if (HasFd())
		return;

	Reset();
	channels.clear();
	registered = false;
	lag = 0;
	pingsent = 0;
	nick = confignick;

	BotInstance->Logs.Normal("LINK", "Connecting to {} ({} port {})", tag, address, port);
	DoConnect(address, port, timeout);
}

void IRCLink::OnConnected()
{
	BotInstance->Logs.Debug("LINK", "Connected to {}, registering as {}", tag, nick);
	if (!password.empty())
		SendLine("PASS :" + password);
	SendLine("NICK " + nick);
	SendLine(ILINE_FORMAT("USER {} 0 * :{}", user, realname));
}

void IRCLink::OnError(BufferedSocketError e)
{
	BotInstance->Logs.Warning("LINK", "Connection to {} failed (error {}): {}", tag, static_cast<int>(e), GetError());
	Close();
	Disconnected();
}

void IRCLink::Disconnected()
{
	channels.clear();
	registered = false;
	pingsent = 0;
	pingtimer.Cancel();

	BotInstance->Logs.Normal("LINK", "Reconnecting to {} in {} seconds", tag, reconnect);
	reconnecttimer.SetInterval(reconnect);
}

void IRCLink::Quit(const std::string& reason)
{
	pingtimer.Cancel();
	reconnecttimer.Cancel();

	if (!HasFd())
		return;

	SendLine("QUIT :" + reason);
	Close();
	channels.clear();
	registered = false;
}

void IRCLink::SendLine(const std::string& line)
{
	BotInstance->Logs.RawIO("LINK", "{} O {}", tag, line);
	WriteData(line + "\r\n");
}

bool IRCLink::Ping()
{
	if (!registered)
		return false;

	const unsigned long long now = NowMsec();
	if (pingsent)
	{
		if (now - pingsent < pinginterval * 2000)
			return true;

		BotInstance->Logs.Warning("LINK", "{} has not answered PING for {} seconds", tag, (now - pingsent) / 1000);
		SetError("Ping timeout");
		OnError(I_ERR_TIMEOUT);
		return false;
	}

	pingsent = now;
	SendLine("PING :" + fmt::to_string(pingsent));
	return true;
}

void IRCLink::JoinChannels()
{
	if (!registered)
		return;

	const std::vector<std::string> wanted = BotInstance->Config->Lookup->GetChannels(tag);
	for (const auto& channel : wanted)
	{
		if (!IsJoined(channel))
			SendLine("JOIN " + channel);
	}

	for (const auto& [_, chan] : channels)
	{
		if (!BotInstance->Config->Lookup->IsMonitored(tag, chan.name))
			SendLine("PART " + chan.name);
	}
}

unsigned long IRCLink::GetLag() const
{
	// A PING which has gone unanswered for longer than the last round trip
	// is a better estimate of the current lag.
	if (pingsent)
		return std::max<unsigned long>(lag, NowMsec() - pingsent);
	return lag;
}

bool IRCLink::IsSynced(const std::string& channel) const
{
	auto it = channels.find(channel);
	return it != channels.end() && it->second.synced;
}

bool IRCLink::IsJoined(const std::string& channel) const
{
	return channels.find(channel) != channels.end();
}

std::optional<MemberInfo> IRCLink::FindMember(const std::string& channel, const std::string& member) const
{
	auto chan = channels.find(channel);
	if (chan == channels.end())
		return std::nullopt;

	auto it = chan->second.members.find(member);
	if (it == chan->second.members.end())
		return std::nullopt;

	return it->second;
}

void IRCLink::SendChannel(const std::string& channel, const std::string& text)
{
	SendLine(ILINE_FORMAT("PRIVMSG {} :{}", channel, text));
}

void IRCLink::SendStatsQuery(char type, const std::string& target)
{
	SendLine(ILINE_FORMAT("STATS {} {}", type, target));
}

void IRCLink::OnDataReady()
{
	std::string line;
	while (GetNextLine(line))
	{
		std::string::size_type rline = line.find('\r');
		if (rline != std::string::npos)
			line.erase(rline);

		try
		{
			ProcessLine(line);
		}
		catch (const CoreException& ex)
		{
			BotInstance->Logs.Normal("LINK", "Error while processing line from {}: {}", tag, line);
			BotInstance->Logs.Normal("LINK", ex.GetReason());
		}

		if (!GetError().empty() || !HasFd())
			return;
	}

	if (recvq.length() > MAX_RECVQ)
		SetError("RecvQ overrun (line too long)");
}

bool IRCLink::Split(const std::string& line, std::string& prefix, std::string& command, std::vector<std::string>& params)
{
	std::string token;
	irc::tokenstream tokens(line);

	if (!tokens.GetMiddle(token))
		return false;

	// Message tags are never requested so they can be skipped.
	if (token[0] == '@' && !tokens.GetMiddle(token))
		return false;

	if (token[0] == ':')
	{
		prefix.assign(token, 1, std::string::npos);
		if (!tokens.GetMiddle(token))
			return false;
	}

	command.assign(token);
	while (tokens.GetTrailing(token))
		params.push_back(token);
	return true;
}

void IRCLink::ProcessLine(const std::string& line)
{
	std::string prefix;
	std::string command;
	std::vector<std::string> params;

	BotInstance->Logs.RawIO("LINK", "{} I {}", tag, line);

	if (!Split(line, prefix, command, params) || command.empty())
		return;

	unsigned int numeric;
	if (command.length() == 3 && std::from_chars(command.data(), command.data() + 3, numeric).ptr == command.data() + 3)
	{
		OnNumeric(numeric, params);
		return;
	}

	std::string source;
	std::string sourceuser;
	std::string sourcehost;
	SplitSource(prefix, source, sourceuser, sourcehost);

	if (irc::equals(command, "PING"))
	{
		SendLine("PONG :" + (params.empty() ? tag : params.back()));
	}
	else if (irc::equals(command, "PONG"))
	{
		if (pingsent)
		{
			lag = static_cast<unsigned long>(NowMsec() - pingsent);
			pingsent = 0;
			BotInstance->Logs.Debug("LINK", "Lag to {} is {}ms", tag, lag);
		}
	}
	else if (irc::equals(command, "ERROR"))
	{
		SetError("Received ERROR " + (params.empty() ? "" : params[0]));
	}
	else if (irc::equals(command, "PRIVMSG"))
	{
		OnPrivmsg(prefix, params);
	}
	else if (irc::equals(command, "JOIN") && !params.empty())
	{
		if (irc::equals(source, nick))
		{
			channels.emplace(params[0], IRCChannel(params[0]));
			SendLine("WHO " + params[0]);
			BotInstance->Logs.Normal("LINK", "Joined {} on {}", params[0], tag);
			return;
		}

		auto chan = channels.find(params[0]);
		if (chan == channels.end())
			return;

		MemberInfo member;
		member.nick = source;
		member.user = sourceuser;
		member.host = sourcehost;
		chan->second.members[source] = member;
	}
	else if (irc::equals(command, "PART") && !params.empty())
	{
		if (irc::equals(source, nick))
		{
			channels.erase(params[0]);
			BotInstance->Logs.Normal("LINK", "Left {} on {}", params[0], tag);
			return;
		}

		auto chan = channels.find(params[0]);
		if (chan != channels.end())
			chan->second.members.erase(source);
	}
	else if (irc::equals(command, "KICK") && params.size() > 1)
	{
		if (irc::equals(params[1], nick))
		{
			channels.erase(params[0]);
			BotInstance->Logs.Normal("LINK", "Kicked from {} on {} by {}", params[0], tag, source);
			return;
		}

		auto chan = channels.find(params[0]);
		if (chan != channels.end())
			chan->second.members.erase(params[1]);
	}
	else if (irc::equals(command, "QUIT"))
	{
		for (auto& [_, chan] : channels)
			chan.members.erase(source);
	}
	else if (irc::equals(command, "NICK") && !params.empty())
	{
		if (irc::equals(source, nick))
			nick = params[0];

		for (auto& [_, chan] : channels)
		{
			auto it = chan.members.find(source);
			if (it == chan.members.end())
				continue;

			MemberInfo member = it->second;
			member.nick = params[0];
			chan.members.erase(it);
			chan.members[member.nick] = member;
		}
	}
	else if (irc::equals(command, "MODE") && params.size() > 1)
	{
		auto chan = channels.find(params[0]);
		if (chan != channels.end())
			OnChannelMode(chan->second, params);
	}
}

void IRCLink::OnNumeric(unsigned int numeric, const std::vector<std::string>& params)
{
	switch (numeric)
	{
		case RPL_WELCOME:
		{
			registered = true;
			if (!params.empty())
				nick = params[0];

			BotInstance->Logs.Normal("LINK", "Connected to {} as {}", tag, nick);
			pingtimer.SetInterval(pinginterval);
			JoinChannels();
			break;
		}

		case RPL_ISUPPORT:
			OnISupport(params);
			break;

		case ERR_ERRONEUSNICKNAME:
		case ERR_NICKNAMEINUSE:
		case ERR_UNAVAILRESOURCE:
		{
			if (registered)
				break;

			BotInstance->Logs.Debug("LINK", "Nickname {} is not available on {}", nick, tag);
			nick.push_back('_');
			SendLine("NICK " + nick);
			break;
		}

		case RPL_NAMREPLY:
			OnNames(params);
			break;

		case RPL_WHOREPLY:
			OnWho(params);
			break;

		case RPL_ENDOFWHO:
		{
			if (params.size() < 2)
				break;

			auto chan = channels.find(params[1]);
			if (chan != channels.end() && !chan->second.synced)
			{
				chan->second.synced = true;
				BotInstance->Logs.Debug("LINK", "Synced {} on {} with {} members", chan->second.name, tag, chan->second.members.size());
			}
			break;
		}

		default:
			BotInstance->Dispatcher.OnNumeric(*this, numeric, params);
			break;
	}
}

void IRCLink::OnISupport(const std::vector<std::string>& params)
{
	// <nick> <token>+ :are supported by this server
	for (size_t i = 1; i + 1 < params.size(); ++i)
	{
		const std::string& token = params[i];
		const size_t eq = token.find('=');
		const std::string key = token.substr(0, eq);
		const std::string value = eq == std::string::npos ? "" : token.substr(eq + 1);

		if (irc::equals(key, "PREFIX"))
		{
			// (ov)@+
			const size_t end = value.find(')');
			if (value.empty() || value[0] != '(' || end == std::string::npos)
				continue;

			const std::string modes = value.substr(1, end - 1);
			const std::string chars = value.substr(end + 1);
			if (modes.length() != chars.length())
				continue;

			prefixmodes = modes;
			prefixchars = chars;
		}
		else if (irc::equals(key, "CHANMODES"))
		{
			// A,B,C,D
			irc::commasepstream groups(value, true);
			std::string lists;
			std::string params;
			std::string setparams;
			groups.GetToken(lists);
			groups.GetToken(params);
			groups.GetToken(setparams);

			parammodes = lists + params;
			setparammodes = setparams;
		}
	}
}

void IRCLink::OnNames(const std::vector<std::string>& params)
{
	// <nick> <type> <channel> :<names>
	if (params.size() < 4)
		return;

	auto chan = channels.find(params[2]);
	if (chan == channels.end())
		return;

	irc::spacesepstream names(params[3]);
	for (std::string name; names.GetToken(name); )
	{
		MemberInfo member;
		size_t pos = 0;
		for (; pos < name.length(); ++pos)
		{
			const size_t status = prefixchars.find(name[pos]);
			if (status == std::string::npos)
				break;
			SetStatus(member, prefixmodes[status], true);
		}

		SplitSource(name.substr(pos), member.nick, member.user, member.host);
		if (member.nick.empty())
			continue;

		auto it = chan->second.members.find(member.nick);
		if (it != chan->second.members.end())
		{
			// Keep the user@host we may already know from WHO.
			if (member.user.empty())
				member.user = it->second.user;
			if (member.host.empty())
				member.host = it->second.host;
		}
		chan->second.members[member.nick] = member;
	}
}

void IRCLink::OnWho(const std::vector<std::string>& params)
{
	// <nick> <channel> <user> <host> <server> <nick> <flags> :<hops> <realname>
	if (params.size() < 7)
		return;

	auto chan = channels.find(params[1]);
	if (chan == channels.end())
		return;

	MemberInfo& member = chan->second.members[params[5]];
	member.nick = params[5];
	member.user = params[2];
	member.host = params[3];

	member.op = member.halfop = member.voice = false;
	for (const char flag : params[6])
	{
		const size_t status = prefixchars.find(flag);
		if (status != std::string::npos)
			SetStatus(member, prefixmodes[status], true);
	}
}

void IRCLink::OnChannelMode(IRCChannel& chan, const std::vector<std::string>& params)
{
	// <channel> <modes> [<param>]+
	bool adding = true;
	size_t param = 2;
	for (const char mode : params[1])
	{
		if (mode == '+' || mode == '-')
		{
			adding = (mode == '+');
			continue;
		}

		if (prefixmodes.find(mode) != std::string::npos)
		{
			if (param >= params.size())
				break;

			auto member = chan.members.find(params[param++]);
			if (member != chan.members.end())
				SetStatus(member->second, mode, adding);
		}
		else if (parammodes.find(mode) != std::string::npos || (adding && setparammodes.find(mode) != std::string::npos))
		{
			param++;
		}
	}
}

void IRCLink::SetStatus(MemberInfo& member, char mode, bool adding)
{
	switch (mode)
	{
		case 'o':
			member.op = adding;
			break;

		case 'h':
			member.halfop = adding;
			break;

		case 'v':
			member.voice = adding;
			break;
	}
}

void IRCLink::OnPrivmsg(const std::string& source, const std::vector<std::string>& params)
{
	// <target> :<text>
	if (params.size() < 2 || params[1].empty() || params[1][0] == '\x01')
		return;

	auto chan = channels.find(params[0]);
	if (chan == channels.end())
		return;

	std::string sourcenick;
	std::string sourceuser;
	std::string sourcehost;
	SplitSource(source, sourcenick, sourceuser, sourcehost);

	BotInstance->Dispatcher.Process(BotInstance->Config->Lookup, *this, chan->second.name, sourcenick,
		sourceuser + "@" + sourcehost, params[1]);
}
