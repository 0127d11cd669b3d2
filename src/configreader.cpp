/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013-2014, 2016-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2012-2014 Attila Molnar <attilamolnar@hush.com>
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

#include <filesystem>

#include "ilinebot.h"
#include "configparser.h"

BotConfig::BotPaths::BotPaths(const std::shared_ptr<ConfigTag>& tag)
	: Config(tag->getString("configdir", ILINEBOT_CONFIG_PATH, 1))
	, Log(tag->getString("logdir", ILINEBOT_LOG_PATH, 1))
{
}

std::string BotConfig::BotPaths::ExpandPath(const std::string& base, const std::string& fragment)
{
	if (fragment.empty() || std::filesystem::path(fragment).is_absolute())
		return fragment;

	const char* home = getenv("HOME");
	if (fragment.starts_with("~/") && home && *home)
		return (std::filesystem::path(home) / fragment.substr(2)).string();

	// A relative base is resolved against the directory the bot was started in.
	return (std::filesystem::absolute(base) / fragment).string();
}

BotConfig::BotConfig()
	: EmptyTag(std::make_shared<ConfigTag>("empty", FilePosition("<auto>", 0, 0)))
	, Paths(EmptyTag)
	, Lookup(std::make_shared<LookupSettings>(EmptyTag))
{
}

void BotConfig::Fill()
{
	Paths = BotPaths(ConfValue("path"));
	Lookup = std::make_shared<LookupSettings>(ConfValue("iline"));
}

void BotConfig::CrossCheckLinks() const
{
	std::set<std::string, irc::insensitive_swo> names;
	for (const auto& [_, tag] : ConfTags("link"))
	{
		const std::string name = tag->getString("name");
		if (name.empty())
			throw ConfigException("<link:name> missing from tag at " + tag->source.str());

		if (name.find_first_of("/ ") != std::string::npos)
			throw ConfigException("<link:name> must not contain a slash or a space at " + tag->source.str());

		if (tag->getString("address").empty())
			throw ConfigException("<link:address> missing from tag at " + tag->source.str());

		if (!names.insert(name).second)
			throw ConfigException("Duplicate link block with name " + name + " at " + tag->source.str());
	}

	if (names.empty())
		BotInstance->Logs.Warning("CONFIG", "Possible configuration error: you have not defined any <link> blocks.");
}

void BotConfig::Read(const std::string& filename)
{
	ParseStack stack(this);
	try
	{
		valid = stack.ParseFile(filename, false);
	}
	catch (const CoreException& err)
	{
		valid = false;
		errstr << err.GetReason() << '\n';
	}
}

bool BotConfig::Apply(const BotConfig* old)
{
	if (old)
		CommandLine = old->CommandLine;

	if (valid)
	{
		try
		{
			Fill();
			CrossCheckLinks();
		}
		catch (const CoreException& err)
		{
			errstr << err.GetReason() << '\n';
		}
	}

	valid = errstr.str().empty();
	if (!valid)
		BotInstance->Logs.Normal("CONFIG", "There were errors in your configuration file:");

	for (std::string line; std::getline(errstr, line); )
	{
		if (line.empty())
			continue;

		// The console is only still attached while booting.
		if (!old)
			fmt::print("{}\n", line);
		BotInstance->Logs.Critical("CONFIG", line);
	}

	errstr.clear();
	errstr.str({});
	return valid;
}

BotConfig::TagList BotConfig::ConfTags(const std::string& tag) const
{
	auto range = config_data.equal_range(tag);
	return TagList(range.first, range.second);
}

const std::shared_ptr<ConfigTag>& BotConfig::ConfValue(const std::string& tag) const
{
	auto tags = ConfTags(tag);
	if (tags.empty())
		return EmptyTag;

	auto first = tags.begin();
	if (std::next(first) != tags.end())
		BotInstance->Logs.Warning("CONFIG", "Multiple <{}> tags found; only first will be used (first at {}, second at {})",
			tag, first->second->source.str(), std::next(first)->second->source.str());

	return first->second;
}
