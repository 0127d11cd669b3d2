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

TEST(sepstream, CommaSepStreamSkipsEmptyTokens)
{
	irc::commasepstream items("IRCnet/#iline,,EFnet/#help");
	std::vector<std::string> tokens;
	for (std::string item; items.GetToken(item); )
		tokens.push_back(item);

	ASSERT_EQ(tokens.size(), 2u);
	EXPECT_EQ(tokens[0], "IRCnet/#iline");
	EXPECT_EQ(tokens[1], "EFnet/#help");
}

TEST(sepstream, CommaSepStreamAllowEmpty)
{
	// CHANMODES groups may be empty.
	irc::commasepstream groups("beI,k,,imnpst", true);
	std::string group;

	ASSERT_TRUE(groups.GetToken(group));
	EXPECT_EQ(group, "beI");
	ASSERT_TRUE(groups.GetToken(group));
	EXPECT_EQ(group, "k");
	ASSERT_TRUE(groups.GetToken(group));
	EXPECT_EQ(group, "");
	ASSERT_TRUE(groups.GetToken(group));
	EXPECT_EQ(group, "imnpst");
	EXPECT_FALSE(groups.GetToken(group));
}

TEST(sepstream, SpaceSepStreamCollapsesSpaces)
{
	irc::spacesepstream list("@IlineBot +alice  bob");
	std::string item;

	ASSERT_TRUE(list.GetToken(item));
	EXPECT_EQ(item, "@IlineBot");
	ASSERT_TRUE(list.GetToken(item));
	EXPECT_EQ(item, "+alice");
	ASSERT_TRUE(list.GetToken(item));
	EXPECT_EQ(item, "bob");
	EXPECT_FALSE(list.GetToken(item));
}

TEST(tokenstream, MiddleAndTrailing)
{
	irc::tokenstream tokens(":irc.example.net 211 IlineBot alice[~a@192.0.2.1] 0 :12 34");
	std::string token;

	ASSERT_TRUE(tokens.GetMiddle(token));
	EXPECT_EQ(token, ":irc.example.net");
	ASSERT_TRUE(tokens.GetMiddle(token));
	EXPECT_EQ(token, "211");
	ASSERT_TRUE(tokens.GetTrailing(token));
	EXPECT_EQ(token, "IlineBot");
	ASSERT_TRUE(tokens.GetTrailing(token));
	EXPECT_EQ(token, "alice[~a@192.0.2.1]");
	ASSERT_TRUE(tokens.GetTrailing(token));
	EXPECT_EQ(token, "0");
	ASSERT_TRUE(tokens.GetTrailing(token));
	EXPECT_EQ(token, "12 34");
	EXPECT_FALSE(tokens.GetTrailing(token));
}

TEST(hashcomp, RfcCaseMapping)
{
	EXPECT_TRUE(irc::equals("Alice[away]", "alice{AWAY}"));
	EXPECT_TRUE(irc::equals("#ILINE", "#iline"));
	EXPECT_FALSE(irc::equals("#iline", "#iline2"));
	EXPECT_EQ(irc::tolower('^'), '~');

	std::map<std::string, int, irc::insensitive_swo> chans = { { "#Iline[1]", 1 } };
	EXPECT_EQ(chans.count("#iline{1}"), 1u);
}
