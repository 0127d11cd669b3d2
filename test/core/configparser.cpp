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

#include <filesystem>
#include <fstream>

namespace
{
	class ConfigParserTest
		: public ilinetest::Test
	{
	protected:
		std::vector<std::filesystem::path> files;

		/** Writes a config file into the temporary directory and returns its path. */
		std::string WriteFile(const std::string& name, const std::string& contents)
		{
			auto path = std::filesystem::temp_directory_path() / ("ilinebot-" + fmt::to_string(getpid()) + "-" + name);
			std::ofstream stream(path);
			stream << contents;
			files.push_back(path);
			return path.string();
		}

		void TearDown() override
		{
			for (const auto& path : files)
			{
				std::error_code ec;
				std::filesystem::remove(path, ec);
			}
			ilinetest::Test::TearDown();
		}
	};
}

TEST_F(ConfigParserTest, ReadsTagsAndValues)
{
	const std::string path = WriteFile("tags.conf",
		"# A comment.\n"
		"<link name=\"TestNet\" address=\"irc.example.com\" port=\"6697\">\n"
		"<iline channels=\"TestNet/#iline\" maxlag=\"2m\" useprefix=\"yes\">\n");

	BotConfig conf;
	conf.Read(path);
	ASSERT_TRUE(conf.Apply(nullptr));

	const auto& link = conf.ConfValue("link");
	EXPECT_EQ(link->getString("name"), "TestNet");
	EXPECT_EQ(link->getNum<unsigned int>("port", 0), 6697);
	EXPECT_EQ(link->source.line, 2);

	const auto& iline = conf.ConfValue("ILINE");
	EXPECT_EQ(iline->getDuration("maxlag", 0), 120);
	EXPECT_TRUE(iline->getBool("useprefix"));
	EXPECT_FALSE(iline->getBool("missing"));

	EXPECT_EQ(conf.ConfValue("nonexistent"), conf.EmptyTag);
	EXPECT_TRUE(conf.ConfTags("nonexistent").empty());
}

TEST_F(ConfigParserTest, ExpandsEntities)
{
	setenv("ILINEBOT_TEST_VALUE", "from-env", 1);
	const std::string path = WriteFile("entities.conf",
		"<define name=\"network\" value=\"TestNet\">\n"
		"<test escapes=\"&lt;&amp;&gt;&quot;&apos;\" numeric=\"&#65;&#x42;\" variable=\"&network;/#iline\" env=\"&env.ILINEBOT_TEST_VALUE;\" lines=\"a&nl;b\">\n");

	BotConfig conf;
	conf.Read(path);
	ASSERT_TRUE(conf.Apply(nullptr));

	const auto& tag = conf.ConfValue("test");
	EXPECT_EQ(tag->getString("escapes"), "<&>\"'");
	EXPECT_EQ(tag->getString("numeric"), "AB");
	EXPECT_EQ(tag->getString("variable"), "TestNet/#iline");
	EXPECT_EQ(tag->getString("env"), "from-env");

	// Linefeeds are only allowed when asked for.
	EXPECT_EQ(tag->getString("lines"), "a b");
	std::string lines;
	EXPECT_TRUE(tag->readString("lines", lines, true));
	EXPECT_EQ(lines, "a\nb");

	// Definitions are consumed by the parser.
	EXPECT_TRUE(conf.ConfTags("define").empty());
}

TEST_F(ConfigParserTest, FollowsIncludes)
{
	const std::string included = WriteFile("included.conf", "<included value=\"yes\">\n");
	const std::string path = WriteFile("main.conf",
		"<include file=\"" + included + "\">\n"
		"<include file=\"" + included + ".missing\" missingokay=\"yes\">\n");

	BotConfig conf;
	conf.Read(path);
	ASSERT_TRUE(conf.Apply(nullptr));
	EXPECT_TRUE(conf.ConfValue("included")->getBool("value"));
}

TEST_F(ConfigParserTest, RejectsBrokenFiles)
{
	const std::string duplicate = WriteFile("duplicate.conf", "<test key=\"1\" key=\"2\">\n");
	BotConfig dupconf;
	dupconf.Read(duplicate);
	EXPECT_FALSE(dupconf.Apply(nullptr));

	const std::string undefined = WriteFile("undefined.conf", "<test key=\"&nothing;\">\n");
	BotConfig undefconf;
	undefconf.Read(undefined);
	EXPECT_FALSE(undefconf.Apply(nullptr));

	const std::string missing = WriteFile("missing.conf", "<include file=\"/nonexistent/ilinebot.conf\">\n");
	BotConfig missingconf;
	missingconf.Read(missing);
	EXPECT_FALSE(missingconf.Apply(nullptr));

	const std::string looped = WriteFile("looped.conf", "");
	std::ofstream(looped) << "<include file=\"" << looped << "\">\n";
	BotConfig loopconf;
	loopconf.Read(looped);
	EXPECT_FALSE(loopconf.Apply(nullptr));
}

TEST_F(ConfigParserTest, ChecksLinkBlocks)
{
	const std::string noname = WriteFile("noname.conf", "<link address=\"irc.example.com\">\n");
	BotConfig nonameconf;
	nonameconf.Read(noname);
	EXPECT_FALSE(nonameconf.Apply(nullptr));

	const std::string duplicate = WriteFile("duplink.conf",
		"<link name=\"TestNet\" address=\"irc.example.com\">\n"
		"<link name=\"testnet\" address=\"irc2.example.com\">\n");
	BotConfig dupconf;
	dupconf.Read(duplicate);
	EXPECT_FALSE(dupconf.Apply(nullptr));
}

TEST_F(ConfigParserTest, ReadsNumbers)
{
	ConfigTag tag("test", FilePosition("<test>", 1, 1));
	tag.GetItems()["kilo"] = "2K";
	tag.GetItems()["hex"] = "0x10";
	tag.GetItems()["negative"] = "-5";
	tag.GetItems()["badmagnitude"] = "5Q";
	tag.GetItems()["garbage"] = "abc";
	tag.GetItems()["duration"] = "1h2m3s";
	tag.GetItems()["badduration"] = "forever";
	tag.GetItems()["char"] = "x";
	tag.GetItems()["chars"] = "xy";

	EXPECT_EQ(tag.getNum<unsigned long>("kilo", 0), 2048);
	EXPECT_EQ(tag.getNum<int>("hex", 0), 16);
	EXPECT_EQ(tag.getNum<int>("negative", 0), -5);
	EXPECT_EQ(tag.getNum<unsigned int>("negative", 7, 0, 100), 7);
	EXPECT_EQ(tag.getNum<int>("badmagnitude", 3), 3);
	EXPECT_EQ(tag.getNum<int>("garbage", 9), 9);
	EXPECT_EQ(tag.getNum<int>("kilo", 1, 0, 1000), 1);
	EXPECT_EQ(tag.getDuration("duration", 0), 3723);
	EXPECT_EQ(tag.getDuration("badduration", 42), 42);
	EXPECT_EQ(tag.getCharacter("char", '!'), 'x');
	EXPECT_EQ(tag.getCharacter("chars", '!'), '!');
	EXPECT_EQ(tag.getCharacter("missing", '!'), '!');
}
