/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013, 2017-2018, 2020-2022 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2012, 2014-2015 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2009 Daniel De Graaf <danieldg@inspircd.org>
 *   Copyright (C) 2007 Craig Edwards <brain@inspircd.org>
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

Timer::Timer(unsigned long interval, bool repeating)
	: secs(interval)
	, repeat(repeating)
{
}

Timer::~Timer()
{
	if (BotInstance)
		Cancel();
}

void Timer::SetInterval(unsigned long interval, bool restart)
{
	secs = interval;
	if (restart)
		BotInstance->Timers.AddTimer(this);
}

void Timer::Cancel()
{
	if (trigger)
		BotInstance->Timers.DelTimer(this);
}

void TimerManager::Schedule(Timer* timer, unsigned long delay)
{
	DelTimer(timer);
	timer->trigger = BotInstance->Time() + delay;
	pending.emplace(timer->trigger, timer);
}

void TimerManager::AddTimer(Timer* timer)
{
	Schedule(timer, timer->secs);
}

void TimerManager::DelTimer(Timer* timer)
{
	if (!timer->trigger)
		return;

	auto [first, last] = pending.equal_range(timer->trigger);
	auto it = std::find_if(first, last, [timer](const auto& entry) { return entry.second == timer; });
	if (it != last)
		pending.erase(it);
	timer->trigger = 0;
}

void TimerManager::TickTimers()
{
	const time_t now = BotInstance->Time();
	while (!pending.empty() && pending.begin()->first <= now)
	{
		// The timer is unscheduled before it fires so that Tick() can
		// reschedule or delete it.
		Timer* timer = pending.begin()->second;
		pending.erase(pending.begin());
		timer->trigger = 0;

		// A repeating timer always waits for the next second so that this loop ends.
		if (timer->Tick() && timer->repeat && !timer->trigger)
			Schedule(timer, std::max(timer->secs, 1UL));
	}
}
