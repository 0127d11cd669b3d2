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
#include "address.h"

CommandDispatcher::CommandDispatcher(LinkManager& Links)
	: links(Links)
	, executor(slot, links)
	, correlator(slot, executor)
{
}

void CommandDispatcher::Process(const std::shared_ptr<const LookupSettings>& settings, Transport& link, const std::string& channel,
	const std::string& nick, const std::string& userhost, const std::string& text, Invocation invocation)
{
	const LookupSettings& conf = *settings;
	if (invocation == Invocation::TOP_LEVEL)
	{
		if (slot.IsBusy())
			return;

		if (conf.LagLimit && link.GetLag() >= conf.LagLimit * 1000)
		{
			BotInstance->Logs.Debug("DISPATCH", "Ignoring {} on {}/{}: lag is {}ms", nick, link.GetTag(), channel, link.GetLag());
			return;
		}
	}

	if (!conf.IsMonitored(link.GetTag(), channel) || !link.IsSynced(channel))
		return;

	if (conf.RequirePrivs)
	{
		auto self = link.FindMember(channel, link.GetNick());
		if (!self || !self->HasStatus())
			return;
	}

	if (!link.FindMember(channel, nick))
		return;

	const std::string& prefix = conf.CommandChar;
	if (text.length() < prefix.length() || !iline::equalsci(text.substr(0, prefix.length()), prefix))
		return;

	if (!flood.Admit(conf))
		return;

	const std::string body = iline::trim(text.substr(prefix.length()));
	const size_t space = body.find(' ');
	const std::string command = iline::tolower(body.substr(0, space));
	const std::string argument = space == std::string::npos ? std::string() : iline::trim(body.substr(space + 1));
	const std::string lookupcmd = iline::tolower(iline::trim(conf.Command));

	if (command == lookupcmd)
	{
		Lookup(settings, link, channel, nick, userhost, argument, invocation);
		return;
	}

	if (conf.CommandHelp && command == "help")
	{
		Reply::Send(conf, link, channel, nick, 0, "Commands: " + prefix + lookupcmd + ", " + prefix + "help & " + prefix + "version");
		Reply::Send(conf, link, channel, nick, 0, "Syntax:   " + prefix + lookupcmd + " [<IP(4/6)>|<nickname>]");
		return;
	}

	if (conf.CommandVersion && command == "version")
	{
		Reply::Send(conf, link, channel, nick, 0, ILINEBOT_VERSION);
		Reply::Send(conf, link, channel, nick, 0, "IRC frontend to the " ILINEBOT_SERVICE " IRCnet I-line lookup service");
		Reply::Send(conf, link, channel, nick, 0, "Use " + prefix + "help for usage information");
		return;
	}
}

void CommandDispatcher::SendLooking(const LookupSettings& settings, Transport& link, const std::string& channel,
	const std::string& nick, unsigned int flags, const std::string& what)
{
	if (!settings.HideLooking)
		Reply::Send(settings, link, channel, nick, flags, "Looking up " + what);
}

void CommandDispatcher::Lookup(const std::shared_ptr<const LookupSettings>& settings, Transport& link, const std::string& channel,
	const std::string& nick, const std::string& userhost, const std::string& argument, Invocation invocation)
{
	const LookupSettings& conf = *settings;
	if (invocation == Invocation::TOP_LEVEL && !conf.HideProcessing)
		Reply::Send(conf, link, channel, nick, 0, "Processing...");

	slot.Acquire(std::make_unique<LookupRequest>(link.GetTag(), channel, nick, settings));
	if (argument.empty())
	{
		LookupSelf(conf, link, channel, nick, userhost);
		return;
	}

	const std::string target = iline::tolower(argument);
	if (Address::IsAddress(target))
	{
		SendLooking(conf, link, channel, nick, RF_ARGUMENT, target);
		executor.Execute(target);
		return;
	}

	auto member = link.FindMember(channel, target);
	if (!member)
	{
		Reply::Send(conf, link, channel, nick, RF_ERROR, "Not an IP(4/6) address or nickname");
		slot.Release();
		return;
	}

	// The lookup is continued as the target so it does not count as another command.
	slot.Release();
	flood.Refund();

	if (!irc::equals(member->nick, nick) && !conf.HideLookingNicks)
		SendLooking(conf, link, channel, nick, RF_NICK, member->nick);

	const std::string selfcommand = iline::trim(conf.CommandChar) + iline::trim(conf.Command);
	Process(settings, link, channel, member->nick, member->GetUserHost(), selfcommand, Invocation::CONTINUATION);
}

void CommandDispatcher::LookupSelf(const LookupSettings& settings, Transport& link, const std::string& channel,
	const std::string& nick, const std::string& userhost)
{
	const std::string extended = settings.ShowExtended ? " (" + nick + "!" + userhost + ")" : std::string();

	const size_t at = userhost.find('@');
	const std::string ident = userhost.substr(0, at);
	const std::string host = at == std::string::npos ? std::string() : userhost.substr(at + 1);

	if (settings.TestWebchat && Address::IsWebGatewayHost(host) && Address::IsHexHost(ident))
	{
		const std::string address = Address::HexToIPv4(ident);
		if (Address::IsAddress(address))
		{
			SendLooking(settings, link, channel, nick, RF_WEBCHAT, address + extended);
			executor.Execute(address);
			return;
		}
	}

	if (Address::IsAddress(host))
	{
		const std::string address = iline::tolower(host);
		SendLooking(settings, link, channel, nick, RF_PUBLIC, address + extended);
		executor.Execute(address);
		return;
	}

	correlator.Begin(link);
}

bool CommandDispatcher::OnNumeric(Transport& link, unsigned int numeric, const std::vector<std::string>& params)
{
	return correlator.OnNumeric(link, numeric, params);
}
