/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013-2016 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2013, 2017-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2009-2010 Daniel De Graaf <danieldg@inspircd.org>
 *   Copyright (C) 2007-2008 Robin Burchell <robin+git@viroteck.net>
 *   Copyright (C) 2006-2007 Craig Edwards <brain@inspircd.org>
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

bool BufferedSocket::ConnectTimeout::Tick()
{
	if (sock->state == I_CONNECTING)
	{
		sock->state = I_ERROR;
		sock->SetError("Connection timed out");
		sock->OnError(I_ERR_TIMEOUT);
	}
	return true;
}

BufferedSocket::BufferedSocket()
	: connecttimeout(this)
{
}

BufferedSocket::~BufferedSocket()
{
	BufferedSocket::Close();
}

void BufferedSocket::DoConnect(const std::string& host, unsigned int port, unsigned long maxtime)
{
	const BufferedSocketError err = BeginConnect(host, port, maxtime);
	if (err == I_ERR_NONE)
		return;

	state = I_ERROR;
	OnError(err);
}

BufferedSocketError BufferedSocket::BeginConnect(const std::string& host, unsigned int port, unsigned long timeout)
{
	addrinfo hints = { };
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	addrinfo* result = nullptr;
	const int gaierr = getaddrinfo(host.c_str(), fmt::to_string(port).c_str(), &hints, &result);
	if (gaierr)
	{
		SetError(gai_strerror(gaierr));
		return I_ERR_RESOLVE;
	}
	std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(result, &freeaddrinfo);

	fd = socket(result->ai_family, SOCK_STREAM, 0);
	if (!HasFd())
	{
		SetError(strerror(errno));
		return I_ERR_SOCKET;
	}

	SocketEngine::NonBlocking(fd);
	if (connect(fd, result->ai_addr, result->ai_addrlen) == -1 && errno != EINPROGRESS)
	{
		SetError(strerror(errno));
		SocketEngine::Close(fd);
		fd = -1;
		return I_ERR_CONNECT;
	}

	// The socket becomes writable once connect() has finished.
	if (!SocketEngine::AddFd(this, FD_WANT_NO_READ | FD_WANT_SINGLE_WRITE | FD_WRITE_WILL_BLOCK))
	{
		SetError("Unable to add the socket to the socket engine");
		SocketEngine::Close(fd);
		fd = -1;
		return I_ERR_SOCKET;
	}

	state = I_CONNECTING;
	connecttimeout.SetInterval(timeout);
	return I_ERR_NONE;
}

void BufferedSocket::Close()
{
	connecttimeout.Cancel();
	if (HasFd())
	{
		FlushSendQ();
		shutdown(fd, SHUT_RDWR);
		SocketEngine::Close(this);
	}
	state = I_DISCONNECTED;
}

void BufferedSocket::Reset()
{
	error.clear();
	recvq.clear();
	sendq.clear();
}

bool BufferedSocket::GetNextLine(std::string& line, char delim)
{
	const size_t eol = recvq.find(delim);
	if (eol == std::string::npos)
		return false;

	line.assign(recvq, 0, eol);
	recvq.erase(0, eol + 1);
	return true;
}

void BufferedSocket::WriteData(const std::string& data)
{
	if (!HasFd())
	{
		BotInstance->Logs.Debug("SOCKET", "Dropping data written to a closed socket: {}", data);
		return;
	}

	sendq.append(data);
	SocketEngine::ChangeEventMask(this, FD_ADD_TRIAL_WRITE);
}

bool BufferedSocket::ReadAvailable()
{
	char buffer[65536];
	const ssize_t len = recv(fd, buffer, sizeof(buffer), 0);
	if (len > 0)
	{
		recvq.append(buffer, len);

		// A full buffer means there is probably more waiting.
		const bool more = len == static_cast<ssize_t>(sizeof(buffer));
		SocketEngine::ChangeEventMask(this, FD_WANT_FAST_READ | (more ? FD_ADD_TRIAL_READ : 0));
		return true;
	}

	if (len < 0 && SocketEngine::IgnoreError())
	{
		SocketEngine::ChangeEventMask(this, FD_WANT_FAST_READ | FD_READ_WILL_BLOCK);
		return true;
	}

	if (len < 0 && errno == EINTR)
	{
		SocketEngine::ChangeEventMask(this, FD_WANT_FAST_READ | FD_ADD_TRIAL_READ);
		return true;
	}

	SetError(len ? strerror(errno) : "Connection closed");
	SocketEngine::ChangeEventMask(this, FD_WANT_NO_READ | FD_WANT_NO_WRITE);
	return false;
}

void BufferedSocket::FlushSendQ()
{
	if (sendq.empty() || !error.empty() || !HasFd() || (GetEventMask() & FD_WRITE_WILL_BLOCK))
		return;

	size_t sent = 0;
	int wanted = FD_WANT_EDGE_WRITE;
	while (sent < sendq.length() && error.empty())
	{
		const ssize_t len = send(fd, sendq.data() + sent, sendq.length() - sent, MSG_NOSIGNAL);
		if (len > 0)
			sent += len;
		else if (len == 0)
			SetError("Connection closed");
		else if (SocketEngine::IgnoreError())
		{
			wanted = FD_WANT_FAST_WRITE | FD_WRITE_WILL_BLOCK;
			break;
		}
		else if (errno != EINTR)
			SetError(strerror(errno));
	}
	sendq.erase(0, sent);

	if (error.empty())
		SocketEngine::ChangeEventMask(this, wanted);
	else
		SocketEngine::ChangeEventMask(this, FD_WANT_NO_READ | FD_WANT_NO_WRITE);
}

void BufferedSocket::CheckError(BufferedSocketError err)
{
	if (error.empty())
		return;

	BotInstance->Logs.Debug("SOCKET", "Error on fd {}: {}", fd, error);
	OnError(err);
}

void BufferedSocket::OnEventHandlerRead()
{
	if (!error.empty())
		return;

	const size_t before = recvq.length();
	if (ReadAvailable() && recvq.length() > before)
	{
		try
		{
			OnDataReady();
		}
		catch (const CoreException& ex)
		{
			BotInstance->Logs.Normal("SOCKET", "Unable to process data from fd {}: {}", fd, ex.GetReason());
			SetError(ex.GetReason());
		}
	}
	CheckError(I_ERR_OTHER);
}

void BufferedSocket::OnEventHandlerWrite()
{
	if (!error.empty())
		return;

	if (state == I_CONNECTING)
	{
		state = I_CONNECTED;
		connecttimeout.Cancel();
		OnConnected();
		if (!HasFd())
			return;

		SocketEngine::ChangeEventMask(this, FD_WANT_FAST_READ | FD_WANT_EDGE_WRITE);
	}

	FlushSendQ();
	CheckError(I_ERR_WRITE);
}

void BufferedSocket::OnEventHandlerError(int errornum)
{
	if (!error.empty())
		return;

	SetError(errornum ? strerror(errornum) : "Connection closed");
	switch (errornum)
	{
		case 0:
		case ECONNREFUSED:
			CheckError(I_ERR_CONNECT);
			break;

		case ETIMEDOUT:
			CheckError(I_ERR_TIMEOUT);
			break;

		case EPIPE:
		case EIO:
			CheckError(I_ERR_WRITE);
			break;

		default:
			CheckError(I_ERR_OTHER);
			break;
	}
}
