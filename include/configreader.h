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

#pragma once

class LookupSettings;

/** A location within a config file, used when reporting errors. */
class CoreExport FilePosition final
{
public:
	std::string name;
	unsigned long line;
	unsigned long column;

	FilePosition(const std::string& Name, unsigned long Line, unsigned long Column);

	/** Formats the position as "file:line:column". */
	std::string str() const;
};

/** A single \<tag key="value"> from the config. The typed getters never
 * throw: a missing, malformed or out of range value is logged and the
 * default is returned instead.
 */
class CoreExport ConfigTag final
{
public:
	typedef std::map<std::string, std::string, irc::insensitive_swo> Items;

private:
	Items items;

	intmax_t getSInt(const std::string& key, intmax_t def, intmax_t min, intmax_t max) const;
	uintmax_t getUInt(const std::string& key, uintmax_t def, uintmax_t min, uintmax_t max) const;

public:
	const std::string name;
	const FilePosition source;

	ConfigTag(const std::string& Name, const FilePosition& Source);

	/** Reads an integer. A K, M or G suffix multiplies the value by a power of 1024. */
	template<std::integral T>
	T getNum(const std::string& key, T def, T min = std::numeric_limits<T>::min(), T max = std::numeric_limits<T>::max()) const
	{
		if constexpr (std::is_signed_v<T>)
			return static_cast<T>(getSInt(key, def, min, max));
		else
			return static_cast<T>(getUInt(key, def, min, max));
	}

	/** Reads a string, falling back to def when it is shorter than minlen or longer than maxlen. */
	std::string getString(const std::string& key, const std::string& def = "", size_t minlen = 0, size_t maxlen = UINT32_MAX) const;

	/** Reads a yes/no, true/false or on/off value. */
	bool getBool(const std::string& key, bool def = false) const;

	/** Reads a value which must be exactly one character long. */
	unsigned char getCharacter(const std::string& key, unsigned char def = '\0') const;

	/** Reads a duration such as "1h30m" as a number of seconds. */
	unsigned long getDuration(const std::string& key, unsigned long def, unsigned long min = 0, unsigned long max = ULONG_MAX) const;

	/** Reads one of a fixed set of case insensitive names. */
	template<typename TReturn>
	TReturn getEnum(const std::string& key, TReturn def, std::initializer_list<std::pair<const char*, TReturn>> enumvals) const
	{
		const std::string val = getString(key);
		if (val.empty())
			return def;

		for (const auto& [enumkey, enumval] : enumvals)
			if (iline::equalsci(val, enumkey))
				return enumval;

		std::vector<std::string> names;
		std::string defname = "(unknown)";
		for (const auto& [enumkey, enumval] : enumvals)
		{
			names.push_back(enumkey);
			if (enumval == def)
				defname = enumkey;
		}
		LogMalformed(key, val, defname, "not one of " + iline::join(names, ", "));
		return def;
	}

	/** Reads the raw value of a key.
	 * @param allow_newline Whether a linefeed may be kept; otherwise each is replaced with a space.
	 * @return False if the key is not set.
	 */
	bool readString(const std::string& key, std::string& value, bool allow_newline = false) const;

	const Items& GetItems() const { return items; }
	Items& GetItems() { return items; }

	void LogMalformed(const std::string& key, const std::string& val, const std::string& def, const std::string& reason) const;
};

/** Options given on the command line. These survive a rehash. */
struct CommandLineConf final
{
	/** --nofork: accepted for init scripts, the bot never daemonises. */
	bool nofork = false;

	/** --debug: log everything to stdout instead of the configured logs. */
	bool forcedebug = false;

	/** Cleared by --nolog. */
	bool writelog = true;

	/** --quiet: no startup banner. */
	bool quiet = false;

	int argc = 0;
	char** argv = nullptr;
};

/** A complete configuration as read from disk. Reading happens in two
 * steps so that a broken rehash can be thrown away without touching the
 * running configuration: Read() parses the files and Apply() validates
 * the result and builds the lookup settings.
 */
class CoreExport BotConfig final
{
	friend struct ParseStack;

public:
	typedef std::multimap<std::string, std::shared_ptr<ConfigTag>, irc::insensitive_swo> TagMap;
	typedef std::ranges::subrange<TagMap::const_iterator> TagList;

	/** The directories from the \<path> tag which relative paths are resolved against. */
	class CoreExport BotPaths final
	{
		static std::string ExpandPath(const std::string& base, const std::string& fragment);

	public:
		std::string Config;
		std::string Log;

		BotPaths(const std::shared_ptr<ConfigTag>& tag);

		std::string PrependConfig(const std::string& fn) const { return ExpandPath(Config, fn); }
		std::string PrependLog(const std::string& fn) const { return ExpandPath(Log, fn); }
	};

private:
	TagMap config_data;

	/** Errors collected while reading, one per line. */
	std::stringstream errstr;

	void Fill();
	void CrossCheckLinks() const;

public:
	CommandLineConf CommandLine;

	/** Returned by ConfValue() for a tag which does not exist. */
	std::shared_ptr<ConfigTag> EmptyTag;

	BotPaths Paths;

	/** Built from the \<iline> tag and shared with every request started under this config. */
	std::shared_ptr<const LookupSettings> Lookup;

	bool valid = true;

	BotConfig();

	/** Parses a config file and everything it includes. */
	void Read(const std::string& filename);

	/** Validates what Read() parsed and reports any errors. On boot the
	 * errors are also printed to the console.
	 * @param old The config being replaced or nullptr on boot.
	 * @return Whether the config can be used.
	 */
	bool Apply(const BotConfig* old);

	/** Retrieves every tag with the given name. */
	TagList ConfTags(const std::string& tag) const;

	/** Retrieves the first tag with the given name or EmptyTag. */
	const std::shared_ptr<ConfigTag>& ConfValue(const std::string& tag) const;
};
