/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2012-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2012-2014 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2007-2008 Robin Burchell <robin+git@viroteck.net>
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

#include <cctype>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <algorithm>
#include <charconv>
#include <concepts>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include "compat.h"
#include "exception.h"

class IlineBot;
CoreExport extern IlineBot* BotInstance;

#include "config.h"
#include "hashcomp.h"
#include "utility/string.h"
#include "timer.h"
#include "socketengine.h"
#include "numerics.h"
#include "configreader.h"
#include "settings.h"
#include "logging.h"
#include "transport.h"
#include "replyformatter.h"
#include "floodcontrol.h"
#include "request.h"
#include "executor.h"
#include "correlator.h"
#include "dispatcher.h"
#include "streamsocket.h"
#include "ircclient.h"

/** Owns everything that lives for the whole run of the bot: the config,
 * the logs, the timers, one IRCLink per \<link> tag and the lookup
 * pipeline that channel messages are handed to.
 */
class CoreExport IlineBot final
{
	/** Set from the signal handler and acted on by the main loop. */
	static sig_atomic_t lastsignal;

	/** Refreshed once per iteration of the main loop. */
	struct timespec ts;

	void Cleanup();
	void HandleSignal(sig_atomic_t signal);

	/** Connects to newly configured networks, reconfigures the existing
	 * ones and quits from the ones that have been removed.
	 */
	void ApplyLinks();

public:
	Log::Manager Logs;
	TimerManager Timers;
	std::unique_ptr<BotConfig> Config;

	/** Finds a connection by network name for the lookup pipeline. */
	LinkManager Links;

	CommandDispatcher Dispatcher;
	std::vector<std::unique_ptr<IRCLink>> Networks;

	/** Set with --config. */
	std::string ConfigFileName = ILINEBOT_CONFIG_PATH "/ilinebot.conf";

	IlineBot(int argc, char** argv);
	~IlineBot();

	/** Reads the config, opens the logs and connects. Exits if the config is broken. */
	void Boot();

	[[noreturn]]
	void Exit(int status);

	/** Reads the config again. A broken config is reported and ignored. */
	void Rehash();

	[[noreturn]]
	void Run();

	static void SetSignal(int signal);

	/** The current time in seconds, as of the start of this loop iteration. */
	inline auto Time() const { return ts.tv_sec; }

	/** The nanosecond part of the current time. */
	inline auto Time_ns() const { return ts.tv_nsec; }

	void UpdateTime();
};
