/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2009 Robin Burchell <robin+git@viroteck.net>
 *   Copyright (C) 2008 Craig Edwards <craigedwards@brainbox.cc>
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

#include "ilinebot_test.h"

namespace
{
	class CountingTimer final
		: public Timer
	{
	public:
		unsigned int ticks = 0;

		CountingTimer(unsigned long interval, bool repeating)
			: Timer(interval, repeating)
		{
		}

		bool Tick() override
		{
			ticks++;
			return true;
		}
	};

	class timer
		: public ilinetest::Test
	{
	};
}

TEST_F(timer, OneShotFiresOnce)
{
	CountingTimer once(0, false);
	BotInstance->Timers.AddTimer(&once);
	EXPECT_EQ(once.GetTrigger(), BotInstance->Time());

	BotInstance->Timers.TickTimers();
	BotInstance->Timers.TickTimers();
	EXPECT_EQ(once.ticks, 1u);
	EXPECT_EQ(once.GetTrigger(), 0);
	EXPECT_EQ(BotInstance->Timers.Count(), 0u);
}

TEST_F(timer, RepeatingIsRescheduled)
{
	CountingTimer repeating(0, true);
	repeating.SetInterval(0);

	BotInstance->Timers.TickTimers();
	EXPECT_EQ(repeating.ticks, 1u);
	EXPECT_EQ(repeating.GetTrigger(), BotInstance->Time() + 1);
	EXPECT_EQ(BotInstance->Timers.Count(), 1u);
}

TEST_F(timer, NotDueYet)
{
	CountingTimer later(60, false);
	later.SetInterval(60);
	BotInstance->Timers.TickTimers();
	EXPECT_EQ(later.ticks, 0u);
	EXPECT_EQ(later.GetTrigger(), BotInstance->Time() + 60);
}

TEST_F(timer, CancelAndDestroy)
{
	CountingTimer cancelled(0, false);
	cancelled.SetInterval(0);
	cancelled.Cancel();
	EXPECT_EQ(BotInstance->Timers.Count(), 0u);

	{
		CountingTimer destroyed(0, false);
		destroyed.SetInterval(0);
		EXPECT_EQ(BotInstance->Timers.Count(), 1u);
	}
	EXPECT_EQ(BotInstance->Timers.Count(), 0u);

	BotInstance->Timers.TickTimers();
	EXPECT_EQ(cancelled.ticks, 0u);
}
