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

#include "ilinebot.h"

namespace
{
	struct FlagLabel final
	{
		ReplyFlag flag;
		const char* shortlabel;
		const char* longlabel;
	};

	const FlagLabel labels[] = {
		{ RF_ARGUMENT,  "A", "Argument"  },
		{ RF_WEBCHAT,   "W", "Webchat"   },
		{ RF_PUBLIC,    "P", "Public"    },
		{ RF_STATSL,    "L", "Stats L"   },
		{ RF_NICK,      "N", "Nick"      },
		{ RF_REPLY,     "<", "Reply"     },
		{ RF_ERROR,     "!", "Error"     },
		{ RF_TRUNCATED, "T", "Truncated" },
		{ RF_GARBAGE,   "G", "Garbage"   },
	};
}

std::string Reply::Labels(unsigned int flags, bool longform)
{
	std::vector<const char*> set;
	for (const auto& label : labels)
	{
		if (flags & label.flag)
			set.push_back(longform ? label.longlabel : label.shortlabel);
	}
	return iline::join(set);
}

std::string Reply::Format(const LookupSettings& settings, const std::string& nick, unsigned int flags, const std::string& body)
{
	std::string line = nick + ": ";

	const std::string prefix = settings.ShowPrefix ? Labels(flags, settings.ShowPrefixLong) : std::string();
	if (!prefix.empty())
		line.append("[").append(prefix).append("] ");

	if (settings.ShowIline)
		line.append("[").append(iline::trim(settings.Command)).append("] ");

	line.append(iline::trim(body));
	return line;
}

void Reply::Send(const LookupSettings& settings, Transport& link, const std::string& channel, const std::string& nick, unsigned int flags, const std::string& body)
{
	link.SendChannel(channel, Format(settings, nick, flags, body));
}
