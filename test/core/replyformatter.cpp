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

class replyformatter : public ilinetest::Test
{
};

TEST_F(replyformatter, LabelsInBitOrder)
{
	EXPECT_EQ(Reply::Labels(0, false), "");
	EXPECT_EQ(Reply::Labels(RF_GARBAGE | RF_ARGUMENT | RF_REPLY, false), "A < G");
	EXPECT_EQ(Reply::Labels(RF_REPLY | RF_ERROR, true), "Reply Error");
	EXPECT_EQ(Reply::Labels(RF_STATSL, true), "Stats L");
	EXPECT_EQ(Reply::Labels(RF_WEBCHAT | RF_PUBLIC | RF_NICK | RF_TRUNCATED, false), "W P N T");
}

TEST_F(replyformatter, DefaultFormat)
{
	auto settings = ilinetest::MakeSettings();
	EXPECT_EQ(Reply::Format(*settings, "alice", RF_REPLY | RF_ERROR, "No reply"), "alice: [Reply Error] [Iline] No reply");
	EXPECT_EQ(Reply::Format(*settings, "alice", 0, "  Processing...  "), "alice: [Iline] Processing...");
}

TEST_F(replyformatter, ShortLabels)
{
	auto settings = ilinetest::MakeSettings({ { "showprefixlong", "no" } });
	EXPECT_EQ(Reply::Format(*settings, "bob", RF_ARGUMENT, "Looking up 192.0.2.1"), "bob: [A] [Iline] Looking up 192.0.2.1");
}

TEST_F(replyformatter, Switches)
{
	auto noprefix = ilinetest::MakeSettings({ { "showprefix", "no" } });
	EXPECT_EQ(Reply::Format(*noprefix, "bob", RF_ERROR, "oops"), "bob: [Iline] oops");

	auto nobanner = ilinetest::MakeSettings({ { "showiline", "no" } });
	EXPECT_EQ(Reply::Format(*nobanner, "bob", RF_ERROR, "oops"), "bob: [Error] oops");

	auto bare = ilinetest::MakeSettings({ { "showprefix", "no" }, { "showiline", "no" }, { "command", "ILine" } });
	EXPECT_EQ(Reply::Format(*bare, "bob", RF_ERROR, "oops"), "bob: oops");
}

TEST_F(replyformatter, BannerUsesTrimmedCommand)
{
	auto settings = ilinetest::MakeSettings({ { "command", "  Iline " } });
	EXPECT_EQ(Reply::Format(*settings, "bob", RF_ERROR, "oops"), "bob: [Error] [Iline] oops");
}

TEST_F(replyformatter, SendAddressesTheChannel)
{
	ilinetest::FakeTransport link;
	auto settings = ilinetest::MakeSettings({ { "command", "Check" } });

	Reply::Send(*settings, link, "#iline", "carol", RF_PUBLIC, "Looking up 192.0.2.9");
	ASSERT_EQ(link.sent.size(), 1u);
	EXPECT_EQ(link.sent[0].channel, "#iline");
	EXPECT_EQ(link.sent[0].text, "carol: [Public] [Check] Looking up 192.0.2.9");
}
