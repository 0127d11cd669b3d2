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

#pragma once

namespace Log
{
	class Sink;
	class FileSink;
	class Manager;

	/** How important a log message is. Lower values are more important. */
	enum class Level
		: uint8_t
	{
		CRITICAL,
		WARNING,
		NORMAL,
		DEBUG,
		RAWIO,
	};

	/** Retrieves the name of a log level as it is written in the config. */
	CoreExport const char* LevelToString(Level level);
}

/** Somewhere that log messages can be written to. */
class CoreExport Log::Sink
{
public:
	virtual ~Sink() = default;

	/** Whether messages logged before the config was read should be replayed to this sink. */
	virtual bool WantsBacklog() const { return true; }

	/** Writes a message to the sink. Throws CoreException if the sink is broken. */
	virtual void Write(time_t time, Level level, const std::string& type, const std::string& message) = 0;
};

/** Writes log messages to a stdio stream. Unless every line is flushed
 * the stream is also flushed on a timer so that a quiet bot does not
 * hold on to messages forever.
 */
class CoreExport Log::FileSink final
	: public Sink
	, public Timer
{
	FILE* const file;
	const std::string path;
	const unsigned long flush;
	const bool owned;
	unsigned long written = 0;

public:
	FileSink(const std::string& Path, FILE* File, unsigned long Flush, bool Owned);
	~FileSink() override;

	bool WantsBacklog() const override { return owned; }
	bool Tick() override;
	void Write(time_t time, Level level, const std::string& type, const std::string& message) override;
};

/** Routes log messages to the sinks configured with \<log> tags. Messages
 * logged before the first config read are held back and replayed once
 * the sinks exist.
 */
class CoreExport Log::Manager final
{
	struct Entry final
	{
		time_t time;
		Level level;
		std::string type;
		std::string message;
	};

	struct Route final
	{
		Level level;
		std::set<std::string, irc::insensitive_swo> types;
		std::shared_ptr<Sink> sink;
		bool fromconfig;

		bool Accepts(Level l, const std::string& t) const;
	};

	std::vector<Entry> backlog;
	bool startup = true;
	std::vector<Route> routes;

	/** Set while writing so a sink which logs does not recurse. */
	bool writing = false;

	void AddRoute(Level level, const std::string& types, std::shared_ptr<Sink> sink, bool fromconfig);
	std::shared_ptr<Sink> CreateSink(const std::shared_ptr<ConfigTag>& tag);
	void Deliver(Route& route, const Entry& entry);
	void Write(Level level, const std::string& type, const std::string& message);

	template <typename... Args>
	void Format(Level level, const std::string& type, const std::string& format, Args&&... args)
	{
		if constexpr (sizeof...(Args) == 0)
			Write(level, type, format);
		else
			Write(level, type, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
	}

public:
	/** Drops every sink that came from the config. */
	void CloseLogs();

	/** Writes everything to the standard output stream in colour (--debug). */
	void EnableDebugMode();

	/** Creates the sinks named by the \<log> tags. */
	void OpenLogs();

	template <typename... Args>
	void Critical(const std::string& type, const std::string& format, Args&&... args)
	{
		Format(Level::CRITICAL, type, format, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void Warning(const std::string& type, const std::string& format, Args&&... args)
	{
		Format(Level::WARNING, type, format, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void Normal(const std::string& type, const std::string& format, Args&&... args)
	{
		Format(Level::NORMAL, type, format, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void Debug(const std::string& type, const std::string& format, Args&&... args)
	{
		Format(Level::DEBUG, type, format, std::forward<Args>(args)...);
	}

	/** Logs traffic to and from the IRC server. */
	template <typename... Args>
	void RawIO(const std::string& type, const std::string& format, Args&&... args)
	{
		Format(Level::RAWIO, type, format, std::forward<Args>(args)...);
	}
};
