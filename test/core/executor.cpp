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

namespace
{
	class executor : public ilinetest::Test
	{
	};

	std::string Clean(const std::vector<std::string>& lines, unsigned int& flags)
	{
		flags = 0;
		return LookupExecutor::Clean(lines, flags);
	}
}

TEST_F(executor, CleanStripsTags)
{
	unsigned int flags;
	EXPECT_EQ(Clean({ "<b>192.0.2.1</b> is  <i>listed</i>  " }, flags), "192.0.2.1 is  listed");
	EXPECT_EQ(flags, 0u);

	EXPECT_EQ(Clean({ "<BR>found<br>" }, flags), "found");
	EXPECT_EQ(flags, 0u);
}

TEST_F(executor, CleanJoinsAtMostThreeLines)
{
	unsigned int flags;
	EXPECT_EQ(Clean({ " one ", "two", "three", "four" }, flags), "one two three");
	EXPECT_EQ(flags, 0u);
}

TEST_F(executor, CleanTruncatesLongReplies)
{
	unsigned int flags;
	const std::string text = Clean({ std::string(400, 'x') }, flags);
	EXPECT_EQ(text.length(), LookupExecutor::MaxLength);
	EXPECT_EQ(flags, static_cast<unsigned int>(RF_TRUNCATED));
}

TEST_F(executor, CleanRemovesGarbage)
{
	unsigned int flags;
	EXPECT_EQ(Clean({ "I-line: yes\x01 \"ok\"!" }, flags), "I-line: yes ok");
	EXPECT_EQ(flags, static_cast<unsigned int>(RF_GARBAGE));

	EXPECT_EQ(Clean({ std::string(310, 'y') + "\x02" }, flags), std::string(300, 'y'));
	EXPECT_EQ(flags, static_cast<unsigned int>(RF_TRUNCATED));

	const std::string withnul = Clean({ std::string("listed\0ok", 9) }, flags);
	EXPECT_EQ(withnul, "listedok");
	EXPECT_EQ(withnul.find('\0'), std::string::npos);
	EXPECT_EQ(flags, static_cast<unsigned int>(RF_GARBAGE));
}

TEST_F(executor, CleanEmpty)
{
	unsigned int flags;
	EXPECT_EQ(Clean({}, flags), "");
	EXPECT_EQ(Clean({ "   ", "" }, flags), "");
	EXPECT_EQ(Clean({ "<p></p>" }, flags), "");
	EXPECT_EQ(flags, 0u);
}

TEST_F(executor, NoReplyWithoutARequest)
{
	ilinetest::FakeTransport link;
	link.Join("#iline");
	BotInstance->Dispatcher.GetExecutor().OnResult({ "orphan" });
	EXPECT_TRUE(link.sent.empty());
}

TEST_F(executor, EmptyReply)
{
	ilinetest::FakeTransport link;
	link.Join("#iline");
	link.AddMember("#iline", "alice", "alice", "192.0.2.1");

	BotInstance->Dispatcher.GetExecutor().Fetch = [](const std::string& url, unsigned long timeout) {
		return std::string();
	};

	auto settings = ilinetest::MakeSettings({ { "url", "lookup/" }, { "hideprocessing", "yes" } });
	BotInstance->Dispatcher.Process(settings, link, "#iline", "alice", "alice@192.0.2.1", "!iline");
	WaitForLookup();

	EXPECT_FALSE(BotInstance->Dispatcher.GetSlot().IsBusy());
	EXPECT_FALSE(BotInstance->Dispatcher.GetExecutor().IsRunning());
	ASSERT_EQ(link.sent.size(), 2u);
	EXPECT_EQ(link.sent[1].text, "alice: [Reply Error] [Iline] No reply (lookup/)");
}

TEST_F(executor, ReplyDroppedWhenChannelIsGone)
{
	auto link = std::make_unique<ilinetest::FakeTransport>();
	link->Join("#iline");
	link->AddMember("#iline", "alice", "alice", "192.0.2.1");

	BotInstance->Dispatcher.GetExecutor().Fetch = [](const std::string& url, unsigned long timeout) {
		return "listed\n";
	};

	auto settings = ilinetest::MakeSettings({ { "hideprocessing", "yes" }, { "hidelooking", "yes" } });
	BotInstance->Dispatcher.Process(settings, *link, "#iline", "alice", "alice@192.0.2.1", "!iline");
	EXPECT_TRUE(BotInstance->Dispatcher.GetSlot().IsBusy());
	EXPECT_TRUE(link->sent.empty());

	// The network disconnects while the lookup is running.
	link.reset();
	WaitForLookup();
	EXPECT_FALSE(BotInstance->Dispatcher.GetSlot().IsBusy());
}

TEST_F(executor, ReadsThreeLinesAtMost)
{
	ilinetest::FakeTransport link;
	link.Join("#iline");
	link.AddMember("#iline", "alice", "alice", "192.0.2.1");

	BotInstance->Dispatcher.GetExecutor().Fetch = [](const std::string& url, unsigned long timeout) {
		return "first\nsecond\nthird\nfourth\n";
	};

	auto settings = ilinetest::MakeSettings({ { "hideprocessing", "yes" }, { "hidelooking", "yes" }, { "showprefix", "no" } });
	BotInstance->Dispatcher.Process(settings, link, "#iline", "alice", "alice@192.0.2.1", "!iline");
	WaitForLookup();

	ASSERT_EQ(link.sent.size(), 1u);
	EXPECT_EQ(link.sent[0].text, "alice: [Iline] first second third");
}

TEST_F(executor, BlankLinesCountTowardsTheLimit)
{
	ilinetest::FakeTransport link;
	link.Join("#iline");
	link.AddMember("#iline", "alice", "alice", "192.0.2.1");

	BotInstance->Dispatcher.GetExecutor().Fetch = [](const std::string& url, unsigned long timeout) {
		return "\n\n\nfoo\nbar\n";
	};

	auto settings = ilinetest::MakeSettings({ { "url", "lookup/" }, { "hideprocessing", "yes" }, { "hidelooking", "yes" } });
	BotInstance->Dispatcher.Process(settings, link, "#iline", "alice", "alice@192.0.2.1", "!iline");
	WaitForLookup();

	ASSERT_EQ(link.sent.size(), 1u);
	EXPECT_EQ(link.sent[0].text, "alice: [Reply Error] [Iline] No reply (lookup/)");
}

TEST_F(executor, BlankLineBetweenReplyLines)
{
	ilinetest::FakeTransport link;
	link.Join("#iline");
	link.AddMember("#iline", "alice", "alice", "192.0.2.1");

	BotInstance->Dispatcher.GetExecutor().Fetch = [](const std::string& url, unsigned long timeout) {
		return "first\n\nthird\nfourth\n";
	};

	auto settings = ilinetest::MakeSettings({ { "hideprocessing", "yes" }, { "hidelooking", "yes" }, { "showprefix", "no" } });
	BotInstance->Dispatcher.Process(settings, link, "#iline", "alice", "alice@192.0.2.1", "!iline");
	WaitForLookup();

	ASSERT_EQ(link.sent.size(), 1u);
	EXPECT_EQ(link.sent[0].text, "alice: [Iline] first  third");
}
