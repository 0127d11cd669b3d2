/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013-2016 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2019-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2009 Daniel De Graaf <danieldg@inspircd.org>
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

enum BufferedSocketState
{
	I_DISCONNECTED,
	I_CONNECTING,
	I_CONNECTED,
	I_ERROR
};

/** Why a BufferedSocket gave up. Passed to OnError(). */
enum BufferedSocketError
{
	I_ERR_NONE,
	I_ERR_TIMEOUT,
	I_ERR_SOCKET,
	I_ERR_CONNECT,
	I_ERR_RESOLVE,
	I_ERR_WRITE,
	I_ERR_OTHER
};

/** An outbound, non-blocking TCP connection which buffers in both
 * directions. Once an error has been set the socket is dead: no more
 * data is read or written and OnError() is called once.
 */
class CoreExport BufferedSocket
	: public EventHandler
{
	/** Gives up on a connection attempt which has not finished in time. */
	class ConnectTimeout final
		: public Timer
	{
		BufferedSocket* const sock;

	public:
		ConnectTimeout(BufferedSocket* s)
			: Timer(0, false)
			, sock(s)
		{
		}

		bool Tick() override;
	};

	ConnectTimeout connecttimeout;

	/** Data which has not been accepted by the kernel yet. */
	std::string sendq;

	std::string error;

	/** Starts connecting. On failure the error is set and the reason returned. */
	BufferedSocketError BeginConnect(const std::string& host, unsigned int port, unsigned long timeout);

	/** Reports the error, if one has been set, to OnError(). */
	void CheckError(BufferedSocketError err);

	/** Reads whatever is available into the receive queue.
	 * @return False if the connection is gone.
	 */
	bool ReadAvailable();

	/** Writes as much of the send queue as the kernel will take. */
	void FlushSendQ();

protected:
	/** Data which has been received but not handled yet. */
	std::string recvq;

	/** Forgets the queues and the error before a reconnect. */
	void Reset();

public:
	BufferedSocketState state = I_DISCONNECTED;

	BufferedSocket();
	~BufferedSocket() override;

	/** Resolves the host and starts a non-blocking connect. The outcome is
	 * reported through OnConnected() or OnError().
	 * @param maxtime The number of seconds to wait before giving up.
	 */
	void DoConnect(const std::string& host, unsigned int port, unsigned long maxtime);

	/** Queues data to be sent. It is written during the next trial write. */
	void WriteData(const std::string& data);

	/** Removes the next complete line from the receive queue.
	 * @return False if no complete line has been received.
	 */
	bool GetNextLine(std::string& line, char delim = '\n');

	/** Marks the socket as dead. The first error set is the one kept. */
	void SetError(const std::string& err) { if (error.empty()) error = err; }
	const std::string& GetError() const { return error; }

	/** Writes what it can of the send queue and closes the socket. */
	virtual void Close();

	virtual void OnConnected() { }
	virtual void OnDataReady() = 0;
	virtual void OnError(BufferedSocketError e) = 0;

	void OnEventHandlerRead() override;
	void OnEventHandlerWrite() override;
	void OnEventHandlerError(int errornum) override;
};
