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


#include "ilinebot_test.h"

class floodcontrol : public ilinetest::Test
{
};

TEST_F(floodcontrol, AdmitsUpToTheLimit)
{
	auto settings = ilinetest::MakeSettings({ { "floodcount", "3" }, { "floodtimeout", "10" } });
	FloodController flood;

	EXPECT_FALSE(flood.IsActive());
	EXPECT_TRUE(flood.Admit(*settings));
	EXPECT_TRUE(flood.IsActive());
	EXPECT_EQ(flood.GetTrigger(), BotInstance->Time() + 10);

	EXPECT_TRUE(flood.Admit(*settings));
	EXPECT_TRUE(flood.Admit(*settings));
	EXPECT_FALSE(flood.Admit(*settings));
	EXPECT_FALSE(flood.Admit(*settings));
	EXPECT_EQ(flood.GetCount(), 3u);
}

TEST_F(floodcontrol, WindowDoesNotSlide)
{
	auto settings = ilinetest::MakeSettings({ { "floodcount", "5" }, { "floodtimeout", "60" } });
	FloodController flood;

	ASSERT_TRUE(flood.Admit(*settings));
	const time_t trigger = flood.GetTrigger();
	ASSERT_TRUE(flood.Admit(*settings));
	EXPECT_EQ(flood.GetTrigger(), trigger);
}

TEST_F(floodcontrol, ExpiryResetsTheWindow)
{
	auto settings = ilinetest::MakeSettings({ { "floodcount", "1" } });
	FloodController flood;

	ASSERT_TRUE(flood.Admit(*settings));
	ASSERT_FALSE(flood.Admit(*settings));

	flood.Tick();
	EXPECT_FALSE(flood.IsActive());
	EXPECT_EQ(flood.GetCount(), 0u);
	EXPECT_TRUE(flood.Admit(*settings));
}

TEST_F(floodcontrol, ZeroMeansDefault)
{
	auto settings = ilinetest::MakeSettings({ { "floodcount", "0" }, { "floodtimeout", "0" } });
	EXPECT_EQ(settings->FloodCount, 5u);
	EXPECT_EQ(settings->FloodTimeout, 60u);

	FloodController flood;
	for (int i = 0; i < 5; ++i)
		EXPECT_TRUE(flood.Admit(*settings));
	EXPECT_FALSE(flood.Admit(*settings));
}

TEST_F(floodcontrol, RefundReturnsAnAdmission)
{
	auto settings = ilinetest::MakeSettings({ { "floodcount", "2" } });
	FloodController flood;

	ASSERT_TRUE(flood.Admit(*settings));
	ASSERT_TRUE(flood.Admit(*settings));
	ASSERT_FALSE(flood.Admit(*settings));

	flood.Refund();
	EXPECT_EQ(flood.GetCount(), 1u);
	EXPECT_TRUE(flood.Admit(*settings));
}
