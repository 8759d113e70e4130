#pragma once

#include <cstddef>
#include <cstdint>

namespace SQ
{
	namespace Net
	{
		// Every single-datagram packet starts with this marker (-1 as int32).
		constexpr uint32_t SinglePacketMarker = 0xFFFFFFFFu;
		constexpr size_t WireMarkerSize = 4;

		// One header space shared by query, master server and RCON packets.
		enum PacketHeaderByte : uint8_t
		{
			HEADER_A2S_INFO                  = 0x54,
			HEADER_S2A_INFO_SOURCE           = 0x49,
			HEADER_S2A_INFO_GOLDSRC          = 0x6D,
			HEADER_A2A_PING                  = 0x69,
			HEADER_A2A_ACK                   = 0x6A,
			HEADER_A2S_PLAYER                = 0x55,
			HEADER_S2A_PLAYER                = 0x44,
			HEADER_A2S_RULES                 = 0x56,
			HEADER_S2A_RULES                 = 0x45,
			HEADER_A2S_GETCHALLENGE          = 0x57,
			HEADER_S2C_CHALLENGE             = 0x41,
			HEADER_A2M_GET_SERVERS           = 0x31,
			HEADER_M2A_SERVER_BATCH          = 0x66,
			HEADER_RCON_GOLDSRC_NO_CHALLENGE = 0x39,
			HEADER_RCON_GOLDSRC_RESPONSE     = 0x6C
		};
	}
}
