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

#pragma once

/** How the command dispatcher was entered. */
enum class Invocation
	: uint8_t
{
	/** A message which was received from a channel. */
	TOP_LEVEL,

	/** A lookup which is being continued on behalf of another nickname. */
	CONTINUATION
};

/** The lookup which is currently in progress. Only the tags of the network
 * and channel are stored so that they can be looked up again when the
 * reply arrives.
 */
class CoreExport LookupRequest final
{
public:
	/** The tag of the network the request was made on. */
	const std::string network;

	/** The channel the request was made in. */
	const std::string channel;

	/** The nickname the replies are addressed to. */
	const std::string nick;

	/** The settings the request was accepted under. */
	const std::shared_ptr<const LookupSettings> settings;

	LookupRequest(const std::string& Network, const std::string& Channel, const std::string& Nick, std::shared_ptr<const LookupSettings> Settings)
		: network(Network)
		, channel(Channel)
		, nick(Nick)
		, settings(std::move(Settings))
	{
	}
};

/** Holds the single lookup request which may be in progress at any time. */
class CoreExport RequestSlot final
{
private:
	/** The request which is in progress or nullptr if idle. */
	std::unique_ptr<LookupRequest> request;

public:
	/** Stores a new request. Any previous request is discarded. */
	void Acquire(std::unique_ptr<LookupRequest> newrequest)
	{
		request = std::move(newrequest);
	}

	/** Discards the request which is in progress. */
	void Release()
	{
		request.reset();
	}

	/** Determines whether a request is in progress. */
	bool IsBusy() const { return !!request; }

	/** Retrieves the request which is in progress or nullptr if idle. */
	const LookupRequest* Get() const { return request.get(); }
};
