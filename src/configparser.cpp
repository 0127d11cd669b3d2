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


#include <cinttypes>
#include <fstream>

#include "ilinebot.h"
#include "configparser.h"
#include "timeutils.h"

namespace
{
	/** Reads the contents of a config file into memory. */
	bool ReadFile(const std::string& path, std::string& contents)
	{
		std::ifstream stream(path, std::ios::in | std::ios::binary);
		if (!stream.is_open())
			return false;

		contents.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
		return !stream.bad();
	}
}

/** Reads the tags from the contents of a single config file. */
struct Parser final
{
	ParseStack& stack;
	const std::string& data;
	size_t pos = 0;
	FilePosition current;
	FilePosition last_tag;
	std::shared_ptr<ConfigTag> tag;

	Parser(ParseStack& Stack, const std::string& Data, const std::string& name)
		: stack(Stack)
		, data(Data)
		, current(name, 1, 1)
		, last_tag(name, 0, 0)
	{
	}

	bool AtEnd() const
	{
		return pos >= data.length();
	}

	int Peek() const
	{
		return AtEnd() ? EOF : static_cast<unsigned char>(data[pos]);
	}

	int Next()
	{
		if (AtEnd())
			throw ConfigException("Unexpected end-of-file");

		const unsigned char ch = data[pos++];
		if (ch == '\n')
		{
			current.line++;
			current.column = 1;
		}
		else
		{
			current.column++;
		}
		return ch;
	}

	void SkipComment()
	{
		while (!AtEnd() && Next() != '\n')
		{
		}
	}

	static bool IsWordChar(int ch)
	{
		return isalnum(ch) || ch == '-' || ch == '.' || ch == '_';
	}

	std::string ReadWord()
	{
		while (!AtEnd() && isspace(Peek()))
			Next();

		std::string word;
		while (IsWordChar(Peek()))
			word.push_back(static_cast<char>(Next()));
		return word;
	}

	// Called after the & of an entity has been read.
	void ReadEntity(const std::string& key, std::string& value)
	{
		std::string name;
		for (int ch = Next(); ch != ';'; ch = Next())
		{
			if (!IsWordChar(ch) && (ch != '#' || !name.empty()))
			{
				stack.errstr << "Invalid XML entity name in value of <" + tag->name + ":" + key + ">\n"
					<< "To include an ampersand or quote, use &amp; or &quot;\n";
				throw ConfigException("Parse error");
			}
			name.push_back(static_cast<char>(ch));
		}

		if (name.empty())
			throw ConfigException("Empty XML entity reference");

		if (name[0] == '#')
		{
			const bool hex = name.length() > 1 && name[1] == 'x';
			const char* begin = name.data() + (hex ? 2 : 1);
			const char* end = name.data() + name.length();
			if (begin == end)
				throw ConfigException("Empty numeric character reference");

			unsigned int chr;
			auto res = std::from_chars(begin, end, chr, hex ? 16 : 10);
			if (res.ec != std::errc{} || res.ptr != end || chr > 255)
				throw ConfigException("Invalid numeric character reference '&" + name + ";'");

			value.push_back(static_cast<char>(chr));
			return;
		}

		if (name.compare(0, 4, "env.") == 0)
		{
			const char* env = getenv(name.c_str() + 4);
			if (!env)
				throw ConfigException("Undefined XML environment entity reference '&" + name + ";'");

			value.append(env);
			return;
		}

		auto var = stack.vars.find(name);
		if (var == stack.vars.end())
			throw ConfigException("Undefined XML entity reference '&" + name + ";'");
		value.append(var->second);
	}

	// Reads a key="value" pair into the current tag. Returns false at the end of the tag.
	bool ReadItem()
	{
		const std::string key = ReadWord();
		const int ch = Next();
		if (key.empty() && ch == '>')
			return false;

		if (key.empty() && ch == '#')
		{
			SkipComment();
			return true;
		}

		if (ch != '=')
			throw ConfigException(ILINE_FORMAT("Invalid character {} in key ({})", static_cast<char>(ch), key));

		if (Next() != '"')
			throw ConfigException("Invalid character in value of <" + tag->name + ":" + key + ">");

		std::string value;
		for (int vch = Next(); vch != '"'; vch = Next())
		{
			if (vch == '&')
				ReadEntity(key, value);
			else if (vch != '\r')
				value.push_back(static_cast<char>(vch));
		}

		if (!tag->GetItems().emplace(key, value).second)
			throw ConfigException("Duplicate key '" + key + "' found");
		return true;
	}

	// Called after the < of a tag has been read.
	void ReadTag()
	{
		last_tag = current;
		const std::string name = ReadWord();
		if (Peek() != '>' && !isspace(Next()))
			throw ConfigException("Invalid character in tag name");

		if (name.empty())
			throw ConfigException("Empty tag name");

		tag = std::make_shared<ConfigTag>(name, last_tag);
		while (ReadItem())
		{
		}

		if (iline::equalsci(name, "include"))
		{
			stack.DoInclude(tag);
		}
		else if (iline::equalsci(name, "define"))
		{
			const std::string varname = tag->getString("name");
			if (varname.empty())
				throw ConfigException("Variable definition must include a variable name, at " + tag->source.str());

			if (!stack.vars.count(varname) || tag->getBool("replace", true))
				stack.vars[varname] = tag->getString("value");
		}
		else
		{
			stack.output.emplace(name, tag);
		}
		tag = nullptr;
	}

	bool Parse()
	{
		try
		{
			while (!AtEnd())
			{
				const int ch = Next();
				switch (ch)
				{
					case '#':
						SkipComment();
						break;

					case '<':
						ReadTag();
						break;

					case ' ':
					case '\r':
					case '\t':
					case '\n':
						break;

					case 0xFE:
					case 0xFF:
						stack.errstr << "Do not save your files as UTF-16 or UTF-32, use UTF-8!\n";
						[[fallthrough]];

					default:
						throw ConfigException("Syntax error - start of tag expected");
				}
			}
			return true;
		}
		catch (const CoreException& err)
		{
			stack.errstr << err.GetReason() << " at " << current.str();
			if (tag)
				stack.errstr << " (inside <" << tag->name << "> tag on line " << tag->source.line << ")";
			else if (last_tag.line)
				stack.errstr << " (last tag was on line " << last_tag.line << ")";
			stack.errstr << '\n';
		}
		return false;
	}
};

FilePosition::FilePosition(const std::string& Name, unsigned long Line, unsigned long Column)
	: name(Name)
	, line(Line)
	, column(Column)
{
}

std::string FilePosition::str() const
{
	return ILINE_FORMAT("{}:{}:{}", name, line, column);
}

ParseStack::ParseStack(BotConfig* conf)
	: output(conf->config_data)
	, errstr(conf->errstr)
{
	vars = {
		{ "newline", "\n" },
		{ "nl",      "\n" },

		{ "amp",  "&"  },
		{ "apos", "'"  },
		{ "gt",   ">"  },
		{ "lt",   "<"  },
		{ "quot", "\"" },

		{ "dir.config", ILINEBOT_CONFIG_PATH },
		{ "dir.log",    ILINEBOT_LOG_PATH    },
	};
}

void ParseStack::DoInclude(const std::shared_ptr<ConfigTag>& tag)
{
	const std::string file = tag->getString("file");
	if (file.empty())
		throw ConfigException("<include> tag without a file at " + tag->source.str());

	if (!ParseFile(file, tag->getBool("missingokay")))
		throw ConfigException("Error in included file " + file);
}

bool ParseStack::ParseFile(const std::string& name, bool missingokay)
{
	const std::string path = BotInstance->Config->Paths.PrependConfig(name);
	if (std::find(reading.begin(), reading.end(), path) != reading.end())
		throw ConfigException("File " + path + " is included recursively (looped inclusion)");

	BotInstance->Logs.Debug("CONFIG", "Opening file: {}", path);
	std::string contents;
	if (!ReadFile(path, contents))
	{
		if (missingokay)
			return true;

		throw ConfigException(ILINE_FORMAT("Could not read \"{}\": {}", path, strerror(errno)));
	}

	reading.push_back(path);
	Parser parser(*this, contents, path);
	const bool ok = parser.Parse();
	reading.pop_back();
	return ok;
}

namespace
{
	/** Reads a number with an optional K, M or G magnitude suffix. Values
	 * which are malformed or outside of the range are logged and replaced
	 * with the default.
	 */
	template<typename Numeric>
	Numeric ReadNumber(const ConfigTag* tag, const std::string& key, Numeric def, Numeric min, Numeric max, Numeric (*convert)(const char*, char**, int))
	{
		std::string value;
		if (!tag->readString(key, value) || value.empty())
			return def;

		char* tail = nullptr;
		Numeric num = convert(value.c_str(), &tail, 0);
		if (tail == value.c_str())
			return def;

		switch (toupper(*tail))
		{
			case '\0':
				break;

			case 'K':
				num *= 1024;
				break;

			case 'M':
				num *= 1024 * 1024;
				break;

			case 'G':
				num *= 1024 * 1024 * 1024;
				break;

			default:
				tag->LogMalformed(key, value, fmt::to_string(def), ILINE_FORMAT("contains an invalid magnitude specifier ({})", *tail));
				return def;
		}

		if (num < min || num > max)
		{
			tag->LogMalformed(key, value, fmt::to_string(def), ILINE_FORMAT("not between {} and {}", min, max));
			return def;
		}
		return num;
	}
}

void ConfigTag::LogMalformed(const std::string& key, const std::string& val, const std::string& def, const std::string& reason) const
{
	BotInstance->Logs.Warning("CONFIG", "The value of <{}:{}> at {} ({}) is {}; using the default ({}) instead.",
		name, key, source.str(), val, reason, def);
}

bool ConfigTag::readString(const std::string& key, std::string& value, bool allow_lf) const
{
	auto item = items.find(key);
	if (item == items.end())
		return false;

	value = item->second;
	if (!allow_lf && value.find('\n') != std::string::npos)
	{
		BotInstance->Logs.Warning("CONFIG", "Value of <{}:{}> at {} contains a linefeed which is not permitted here; replacing with a space.",
			name, key, source.str());
		std::replace(value.begin(), value.end(), '\n', ' ');
	}
	return true;
}

std::string ConfigTag::getString(const std::string& key, const std::string& def, size_t minlen, size_t maxlen) const
{
	std::string res;
	if (!readString(key, res))
		return def;

	if (res.length() < minlen || res.length() > maxlen)
	{
		LogMalformed(key, res, def, ILINE_FORMAT("not between {} and {} characters long", minlen, maxlen));
		return def;
	}
	return res;
}

intmax_t ConfigTag::getSInt(const std::string& key, intmax_t def, intmax_t min, intmax_t max) const
{
	return ReadNumber<intmax_t>(this, key, def, min, max, strtoimax);
}

uintmax_t ConfigTag::getUInt(const std::string& key, uintmax_t def, uintmax_t min, uintmax_t max) const
{
	return ReadNumber<uintmax_t>(this, key, def, min, max, strtoumax);
}

unsigned long ConfigTag::getDuration(const std::string& key, unsigned long def, unsigned long min, unsigned long max) const
{
	std::string value;
	if (!readString(key, value) || value.empty())
		return def;

	unsigned long duration;
	if (!Duration::TryFrom(value, duration))
	{
		LogMalformed(key, value, fmt::to_string(def), "is not a duration");
		return def;
	}

	if (duration < min || duration > max)
	{
		LogMalformed(key, value, fmt::to_string(def), ILINE_FORMAT("not between {} and {}", min, max));
		return def;
	}
	return duration;
}

bool ConfigTag::getBool(const std::string& key, bool def) const
{
	std::string value;
	if (!readString(key, value) || value.empty())
		return def;

	for (const char* yes : { "yes", "true", "on" })
		if (iline::equalsci(value, yes))
			return true;

	for (const char* no : { "no", "false", "off" })
		if (iline::equalsci(value, no))
			return false;

	LogMalformed(key, value, def ? "yes" : "no", "is not a boolean");
	return def;
}

unsigned char ConfigTag::getCharacter(const std::string& key, unsigned char def) const
{
	std::string value;
	if (!readString(key, value) || value.length() != 1)
		return def;

	return value[0];
}

ConfigTag::ConfigTag(const std::string& Name, const FilePosition& Source)
	: name(Name)
	, source(Source)
{
}
