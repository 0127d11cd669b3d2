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


#pragma once

/** A callback which fires after a number of seconds have elapsed, either
 * once or every time the interval passes. Timers are scheduled with the
 * TimerManager which checks them once per iteration of the main loop.
 */
class CoreExport Timer
{
	friend class TimerManager;

	/** When this timer is next due or 0 if it is not scheduled. */
	time_t trigger = 0;

	/** The number of seconds between scheduling and firing. */
	unsigned long secs;

	/** Whether the timer is rescheduled automatically after it fires. */
	const bool repeat;

public:
	Timer(unsigned long interval, bool repeating);
	virtual ~Timer();

	/** Retrieves the time this timer is next due or 0 if it is idle. */
	time_t GetTrigger() const { return trigger; }

	/** Changes the number of seconds between ticks.
	 * @param interval The new interval.
	 * @param restart Whether to (re)schedule the timer from the current time.
	 */
	void SetInterval(unsigned long interval, bool restart = true);

	/** Unschedules the timer if it is pending. */
	void Cancel();

	/** Fires the timer.
	 * @return False if the timer deleted itself while ticking.
	 */
	virtual bool Tick() = 0;
};

/** Keeps the pending timers ordered by when they are due. */
class CoreExport TimerManager final
{
	std::multimap<time_t, Timer*> pending;

	void Schedule(Timer* timer, unsigned long delay);

public:
	/** Schedules a timer from the current time, replacing any earlier schedule. */
	void AddTimer(Timer* timer);

	/** Unschedules a timer. Does nothing if it is not pending. */
	void DelTimer(Timer* timer);

	/** Fires every timer which is due. */
	void TickTimers();

	size_t Count() const { return pending.size(); }
};
