#pragma once

#include "srcquery/net/packet.h"

namespace SQ
{
	namespace Net
	{
		/*
		 * Builds the packet selected by raw[0] from the bytes that follow it.
		 *
		 * Throws UnknownHeaderError for a header outside KnownHeaders and
		 * UnderrunError when the payload is shorter than its schema. This is
		 * the only place header bytes are interpreted.
		 */
		Packet CreatePacket(const Bytes &raw);

		// Checks and strips the FF FF FF FF marker, then calls CreatePacket().
		Packet CreatePacketFromDatagram(const Bytes &datagram);
	}
}
