/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2022-2024 Sadie Powell <sadie@witchery.services>
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
#include "timeutils.h"

#include <fmt/color.h>

namespace
{
	/** Prints every message to stdout in colour when started with --debug. */
	class ConsoleSink final
		: public Log::Sink
	{
	public:
		void Write(time_t time, Log::Level level, const std::string& type, const std::string& message) override
		{
			fmt::print("{} {} {}: {}\n",
				fmt::styled(Time::ToString(time, "%d %b %H:%M:%S"), fmt::fg(fmt::terminal_color::yellow)),
				fmt::styled(Log::LevelToString(level), fmt::fg(fmt::terminal_color::blue)),
				fmt::styled(type, fmt::fg(fmt::terminal_color::green)),
				message);
		}
	};
}

const char* Log::LevelToString(Log::Level level)
{
	switch (level)
	{
		case Level::CRITICAL: return "critical";
		case Level::WARNING:  return "warning";
		case Level::NORMAL:   return "normal";
		case Level::DEBUG:    return "debug";
		case Level::RAWIO:    return "rawio";
	}
	return "unknown";
}

Log::FileSink::FileSink(const std::string& Path, FILE* File, unsigned long Flush, bool Owned)
	: Timer(15 * 60, true)
	, file(File)
	, path(Path)
	, flush(Flush)
	, owned(Owned)
{
	if (flush > 1)
		BotInstance->Timers.AddTimer(this);
}

Log::FileSink::~FileSink()
{
	if (owned)
		fclose(file);
}

bool Log::FileSink::Tick()
{
	fflush(file);
	return true;
}

void Log::FileSink::Write(time_t time, Level level, const std::string& type, const std::string& message)
{
	fmt::print(file, "{} {}: {}\n", Time::ToString(time), type, message);
	if (++written % flush == 0)
		fflush(file);

	if (ferror(file))
		throw CoreException(ILINE_FORMAT("Unable to write to {}: {}", path, strerror(errno)));
}

bool Log::Manager::Route::Accepts(Level l, const std::string& t) const
{
	return sink && l <= level && (types.empty() || types.count(t));
}

void Log::Manager::AddRoute(Level level, const std::string& types, std::shared_ptr<Sink> sink, bool fromconfig)
{
	Route route { level, {}, std::move(sink), fromconfig };
	irc::spacesepstream typestream(types);
	for (std::string type; typestream.GetToken(type); )
	{
		// A wildcard anywhere in the list means every type.
		if (type == "*")
		{
			route.types.clear();
			break;
		}
		route.types.insert(type);
	}
	routes.push_back(std::move(route));
}

void Log::Manager::Deliver(Route& route, const Entry& entry)
{
	try
	{
		route.sink->Write(entry.time, entry.level, entry.type, entry.message);
	}
	catch (const CoreException& err)
	{
		// A broken sink is disabled rather than taking the bot down with it.
		route.sink.reset();
		fmt::print(stderr, "Disabling a logger after it failed: {}\n", err.GetReason());
	}
}

std::shared_ptr<Log::Sink> Log::Manager::CreateSink(const std::shared_ptr<ConfigTag>& tag)
{
	const std::string method = tag->getString("method", "file", 1);
	if (iline::equalsci(method, "stderr"))
		return std::make_shared<FileSink>("stderr", stderr, 1, false);

	if (iline::equalsci(method, "stdout"))
		return std::make_shared<FileSink>("stdout", stdout, 1, false);

	if (!iline::equalsci(method, "file"))
		throw ConfigException(method + " is not a valid logging method at " + tag->source.str());

	const std::string target = tag->getString("target");
	if (target.empty())
		throw ConfigException("<log:target> must be specified for file logger at " + tag->source.str());

	// The target may contain strftime(3) escapes to rotate by date.
	const std::string path = BotInstance->Config->Paths.PrependLog(Time::ToString(BotInstance->Time(), target.c_str()));
	FILE* file = fopen(path.c_str(), "a");
	if (!file)
		throw CoreException(ILINE_FORMAT("Unable to open {} for file logger at {}: {}", path, tag->source.str(), strerror(errno)));

	return std::make_shared<FileSink>(path, file, tag->getNum<unsigned long>("flush", 20, 1), true);
}

void Log::Manager::CloseLogs()
{
	writing = true;
	std::erase_if(routes, [](const Route& route) { return route.fromconfig; });
	writing = false;
}

void Log::Manager::EnableDebugMode()
{
	AddRoute(Level::RAWIO, "*", std::make_shared<ConsoleSink>(), false);
}

void Log::Manager::OpenLogs()
{
	const CommandLineConf& cmdline = BotInstance->Config->CommandLine;
	if (cmdline.forcedebug || !cmdline.writelog)
	{
		Normal("LOG", "Not opening loggers because we were started with {}", cmdline.forcedebug ? "--debug" : "--nolog");
		return;
	}

	for (const auto& [_, tag] : BotInstance->Config->ConfTags("log"))
	{
		const Level level = tag->getEnum("level", Level::NORMAL, {
			{ "critical", Level::CRITICAL },
			{ "warning",  Level::WARNING  },
			{ "normal",   Level::NORMAL   },
			{ "debug",    Level::DEBUG    },
			{ "rawio",    Level::RAWIO    },
		});
		AddRoute(level, tag->getString("type", "*", 1), CreateSink(tag), true);
	}

	if (!startup)
		return;

	for (auto& route : routes)
	{
		if (!route.sink || !route.sink->WantsBacklog())
			continue;

		for (const auto& entry : backlog)
		{
			if (route.Accepts(entry.level, entry.type))
				Deliver(route, entry);
		}
	}
	backlog.clear();
	backlog.shrink_to_fit();
	startup = false;
}

void Log::Manager::Write(Level level, const std::string& type, const std::string& message)
{
	if (writing)
		return;

	writing = true;
	const Entry entry { BotInstance->Time(), level, type, message };
	for (auto& route : routes)
	{
		if (route.Accepts(level, type))
			Deliver(route, entry);
	}

	if (startup)
		backlog.push_back(entry);
	writing = false;
}
