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

StatsCorrelator::StatsCorrelator(RequestSlot& Slot, LookupExecutor& Executor)
	: Timer(30, false)
	, slot(Slot)
	, executor(Executor)
{
}

void StatsCorrelator::Stop()
{
	state = State::IDLE;
	Cancel();
}

void StatsCorrelator::Abort()
{
	Stop();
	slot.Release();
}

void StatsCorrelator::Begin(Transport& link)
{
	const LookupRequest* request = slot.Get();
	if (!request)
		return;

	state = State::AWAITING_STATS;
	SetInterval(request->settings->StatsTimeout);
	link.SendStatsQuery('L', request->nick);
	BotInstance->Logs.Debug("CORRELATOR", "Sent STATS L for {} on {}", request->nick, link.GetTag());
}

bool StatsCorrelator::OnNumeric(Transport& link, unsigned int numeric, const std::vector<std::string>& params)
{
	const LookupRequest* request = slot.Get();
	if (state != State::AWAITING_STATS || !request || !irc::equals(link.GetTag(), request->network))
		return false;

	switch (numeric)
	{
		case RPL_STATSLINKINFO:
			return OnStatsLinkInfo(link, *request, params);

		case ERR_NOPRIVILEGES:
			BotInstance->Logs.Debug("CORRELATOR", "STATS L for {} was refused", request->nick);
			Abort();
			return true;

		case RPL_ENDOFSTATS:
			BotInstance->Logs.Debug("CORRELATOR", "STATS L for {} ended without a match", request->nick);
			Abort();
			return true;
	}
	return false;
}

bool StatsCorrelator::OnStatsLinkInfo(Transport& link, const LookupRequest& request, const std::vector<std::string>& params)
{
	// <target> <nick[user@host]> <sendq> <sent msgs> <sent kb> <recv msgs> <recv kb> <time open>
	if (params.size() < 2)
		return false;

	const std::string& linkname = params[1];
	if (!irc::equals(linkname.substr(0, linkname.find('[')), request.nick))
		return false;

	Stop();

	static const std::regex hostregex(".*\\[.*@(.*)\\].*", std::regex::ECMAScript | std::regex::optimize);
	std::smatch match;
	std::string host = std::regex_match(linkname, match, hostregex) ? match[1].str() : linkname;
	host = iline::tolower(iline::trim(host));

	if (!link.IsJoined(request.channel))
	{
		slot.Release();
		return true;
	}

	const LookupSettings& settings = *request.settings;
	std::string extended;
	if (settings.ShowExtended)
	{
		auto member = link.FindMember(request.channel, request.nick);
		if (member)
			extended = " (" + member->nick + "!" + member->GetUserHost() + ")";
		else
			extended = " (" + request.nick + " not found)";
	}

	if (!Address::IsAddress(host))
	{
		Reply::Send(settings, link, request.channel, request.nick, RF_ERROR, "You do not seem to have an IP" + extended);
		slot.Release();
		return true;
	}

	if (!settings.HideLooking)
		Reply::Send(settings, link, request.channel, request.nick, RF_STATSL, "Looking up " + host + extended);

	executor.Execute(host);
	return true;
}

bool StatsCorrelator::Tick()
{
	const LookupRequest* request = slot.Get();
	if (request)
		BotInstance->Logs.Warning("CORRELATOR", "Timed out waiting for STATS L on {} for {}", request->network, request->nick);

	state = State::IDLE;
	slot.Release();
	return true;
}
