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
	class dispatcher : public ilinetest::Test
	{
	protected:
		std::unique_ptr<ilinetest::FakeTransport> link;

		void SetUp() override
		{
			ilinetest::Test::SetUp();
			link = std::make_unique<ilinetest::FakeTransport>();
			link->Join("#iline");
			link->AddMember("#iline", "alice", "alice", "192.0.2.1");
			link->AddMember("#iline", "bob", "~bob", "198.51.100.7");

			BotInstance->Dispatcher.GetExecutor().Fetch = [](const std::string& url, unsigned long timeout) {
				return "Result for " + url.substr(url.rfind('/') + 1) + "\n";
			};
		}

		void TearDown() override
		{
			link.reset();
			ilinetest::Test::TearDown();
		}

		void Say(const std::shared_ptr<const LookupSettings>& settings, const std::string& nick, const std::string& text, const std::string& channel = "#iline")
		{
			auto member = link->FindMember(channel, nick);
			const std::string userhost = member ? member->GetUserHost() : nick + "@unknown.example.com";
			BotInstance->Dispatcher.Process(settings, *link, channel, nick, userhost, text);
		}

		unsigned long FloodCount()
		{
			return BotInstance->Dispatcher.GetFlood().GetCount();
		}
	};

	std::shared_ptr<const LookupSettings> Settings(std::initializer_list<std::pair<const char*, const char*>> items = {})
	{
		auto tag = std::make_shared<ConfigTag>("iline", FilePosition("<test>", 0, 0));
		tag->GetItems()["channels"] = "TestNet/#iline";
		tag->GetItems()["url"] = "lookup/";
		for (const auto& [key, value] : items)
			tag->GetItems()[key] = value;
		return std::make_shared<LookupSettings>(tag);
	}
}

TEST_F(dispatcher, LooksUpThePublicAddress)
{
	Say(Settings({ { "testwebchat", "no" } }), "alice", "!iline");
	EXPECT_TRUE(BotInstance->Dispatcher.GetSlot().IsBusy());
	WaitForLookup();

	const std::vector<std::string> expected = {
		"alice: [Iline] Processing...",
		"alice: [Public] [Iline] Looking up 192.0.2.1 (alice!alice@192.0.2.1)",
		"alice: [Reply] [Iline] Result for 192.0.2.1",
	};
	EXPECT_EQ(link->Texts(), expected);
	EXPECT_EQ(FloodCount(), 1u);
	EXPECT_FALSE(BotInstance->Dispatcher.GetSlot().IsBusy());
}

TEST_F(dispatcher, LooksUpAnotherNick)
{
	Say(Settings(), "alice", "!iline BOB");
	WaitForLookup();

	const std::vector<std::string> expected = {
		"alice: [Iline] Processing...",
		"alice: [Nick] [Iline] Looking up bob",
		"bob: [Public] [Iline] Looking up 198.51.100.7 (bob!~bob@198.51.100.7)",
		"bob: [Reply] [Iline] Result for 198.51.100.7",
	};
	EXPECT_EQ(link->Texts(), expected);

	// The continued lookup replaces the command that asked for it.
	EXPECT_EQ(FloodCount(), 1u);
}

TEST_F(dispatcher, LooksUpOwnNickQuietly)
{
	Say(Settings({ { "hideprocessing", "yes" } }), "alice", "!iline alice");
	WaitForLookup();

	const std::vector<std::string> expected = {
		"alice: [Public] [Iline] Looking up 192.0.2.1 (alice!alice@192.0.2.1)",
		"alice: [Reply] [Iline] Result for 192.0.2.1",
	};
	EXPECT_EQ(link->Texts(), expected);
}

TEST_F(dispatcher, Help)
{
	Say(Settings(), "alice", "!help");

	const std::vector<std::string> expected = {
		"alice: [Iline] Commands: !iline, !help & !version",
		"alice: [Iline] Syntax:   !iline [<IP(4/6)>|<nickname>]",
	};
	EXPECT_EQ(link->Texts(), expected);
	EXPECT_EQ(FloodCount(), 1u);
	EXPECT_FALSE(BotInstance->Dispatcher.GetSlot().IsBusy());

	link->sent.clear();
	Say(Settings({ { "commandhelp", "no" } }), "alice", "!help");
	EXPECT_TRUE(link->sent.empty());
}

TEST_F(dispatcher, Version)
{
	Say(Settings({ { "showiline", "no" } }), "alice", "!VERSION");

	ASSERT_EQ(link->sent.size(), 3u);
	EXPECT_EQ(link->sent[0].text, "alice: " ILINEBOT_VERSION);
	EXPECT_EQ(link->sent[2].text, "alice: Use !help for usage information");

	link->sent.clear();
	Say(Settings({ { "commandversion", "no" } }), "alice", "!version");
	EXPECT_TRUE(link->sent.empty());
}

TEST_F(dispatcher, LooksUpAnArgument)
{
	Say(Settings({ { "hideprocessing", "yes" } }), "alice", "!Iline   2001:DB8::1  ");
	WaitForLookup();

	const std::vector<std::string> expected = {
		"alice: [Argument] [Iline] Looking up 2001:db8::1",
		"alice: [Reply] [Iline] Result for 2001:db8::1",
	};
	EXPECT_EQ(link->Texts(), expected);
}

TEST_F(dispatcher, RejectsUnknownArguments)
{
	Say(Settings(), "alice", "!iline carol");

	const std::vector<std::string> expected = {
		"alice: [Iline] Processing...",
		"alice: [Error] [Iline] Not an IP(4/6) address or nickname",
	};
	EXPECT_EQ(link->Texts(), expected);
	EXPECT_FALSE(BotInstance->Dispatcher.GetSlot().IsBusy());
}

TEST_F(dispatcher, DecodesWebchatIdents)
{
	link->AddMember("#iline", "dave", "c0000263", "gateway.mibbit.com");
	Say(Settings({ { "hideprocessing", "yes" }, { "showextended", "no" } }), "dave", "!iline");
	WaitForLookup();

	const std::vector<std::string> expected = {
		"dave: [Webchat] [Iline] Looking up 192.0.2.99",
		"dave: [Reply] [Iline] Result for 192.0.2.99",
	};
	EXPECT_EQ(link->Texts(), expected);
}

TEST_F(dispatcher, WebchatIdentsCanBeIgnored)
{
	link->AddMember("#iline", "dave", "c0000263", "gateway.mibbit.com");
	Say(Settings({ { "hideprocessing", "yes" }, { "testwebchat", "no" } }), "dave", "!iline");

	EXPECT_TRUE(link->sent.empty());
	ASSERT_EQ(link->stats.size(), 1u);
	EXPECT_EQ(link->stats[0].second, "dave");
	EXPECT_EQ(BotInstance->Dispatcher.GetCorrelator().GetState(), StatsCorrelator::State::AWAITING_STATS);
}

TEST_F(dispatcher, IgnoresWhileBusy)
{
	auto settings = Settings();
	Say(settings, "alice", "!iline");
	const size_t sent = link->sent.size();

	Say(settings, "bob", "!iline");
	Say(settings, "bob", "!help");
	EXPECT_EQ(link->sent.size(), sent);
	EXPECT_EQ(FloodCount(), 1u);
	WaitForLookup();
}

TEST_F(dispatcher, IgnoresWhenLagging)
{
	link->lag = 5000;
	Say(Settings(), "alice", "!help");
	EXPECT_TRUE(link->sent.empty());

	link->sent.clear();
	Say(Settings({ { "laglimit", "0" } }), "alice", "!help");
	EXPECT_EQ(link->sent.size(), 2u);
}

TEST_F(dispatcher, RequiresPrivileges)
{
	link->channels["#iline"][link->nick].op = false;
	Say(Settings(), "alice", "!help");
	EXPECT_TRUE(link->sent.empty());

	link->channels["#iline"][link->nick].voice = true;
	Say(Settings(), "alice", "!help");
	EXPECT_EQ(link->sent.size(), 2u);

	link->sent.clear();
	link->channels["#iline"][link->nick].voice = false;
	Say(Settings({ { "requireprivs", "no" } }), "alice", "!help");
	EXPECT_EQ(link->sent.size(), 2u);
}

TEST_F(dispatcher, IgnoresUnwantedMessages)
{
	auto settings = Settings();

	// Not a command.
	Say(settings, "alice", "iline");
	Say(settings, "alice", "");
	Say(settings, "alice", "!unknown");

	// Not a member of the channel.
	Say(settings, "mallory", "!help");

	// Not a monitored channel.
	link->Join("#other");
	link->AddMember("#other", "alice", "alice", "192.0.2.1");
	Say(settings, "alice", "!help", "#other");

	// Not synced yet.
	link->Join("#iline", false);
	link->synced.erase("#iline");
	Say(settings, "alice", "!help");

	EXPECT_TRUE(link->sent.empty());
	EXPECT_FALSE(BotInstance->Dispatcher.GetSlot().IsBusy());
}

TEST_F(dispatcher, CustomPrefixAndCommand)
{
	auto settings = Settings({ { "commandchar", "?" }, { "command", "Check" }, { "hideprocessing", "yes" } });
	Say(settings, "alice", "!check");
	EXPECT_TRUE(link->sent.empty());

	Say(settings, "alice", "?help");
	ASSERT_EQ(link->sent.size(), 2u);
	EXPECT_EQ(link->sent[0].text, "alice: [Check] Commands: ?check, ?help & ?version");
}

TEST_F(dispatcher, FloodLimit)
{
	auto settings = Settings({ { "floodcount", "2" } });
	Say(settings, "alice", "!help");
	Say(settings, "alice", "!help");
	Say(settings, "alice", "!help");
	EXPECT_EQ(link->sent.size(), 4u);
	EXPECT_EQ(FloodCount(), 2u);

	// Once the window closes commands are accepted again.
	EXPECT_TRUE(BotInstance->Dispatcher.GetFlood().Tick());
	Say(settings, "alice", "!help");
	EXPECT_EQ(link->sent.size(), 6u);
}

TEST_F(dispatcher, UnknownCommandsCountTowardsFlood)
{
	Say(Settings(), "alice", "!unknown");
	EXPECT_EQ(FloodCount(), 1u);
}
