#pragma once

#include "srcquery/net/packet_buffer.h"
#include "srcquery/net/packet_headers.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace SQ
{
	namespace Net
	{
		enum class MasterRegion : uint8_t
		{
			UsEastCoast  = 0x00,
			UsWestCoast  = 0x01,
			SouthAmerica = 0x02,
			Europe       = 0x03,
			Asia         = 0x04,
			Australia    = 0x05,
			MiddleEast   = 0x06,
			Africa       = 0x07,
			All          = 0xFF
		};

		// Address of a listing start ("seed"); the master answers with the
		// first page of servers. It also terminates the last page.
		constexpr const char *MasterSeedAddress = "0.0.0.0:0";

		struct ServerAddress
		{
			std::array<uint8_t, 4> ip{};
			uint16_t port = 0;

			bool IsSeed() const;
			std::string ToString() const;
		};

		struct MasterServerQueryRequest
		{
			static constexpr uint8_t Header = HEADER_A2M_GET_SERVERS;
			static constexpr const char *Name = "MasterServerQueryRequest";

			MasterRegion region = MasterRegion::All;
			// Last address of the previous page, or the seed address.
			std::string start_address = MasterSeedAddress;
			// Filter string such as "\\gamedir\\cstrike\\dedicated\\1".
			std::string filter;

			void Encode(PacketBuffer &out) const;
			static MasterServerQueryRequest Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct MasterServerQueryResponse
		{
			static constexpr uint8_t Header = HEADER_M2A_SERVER_BATCH;
			static constexpr const char *Name = "MasterServerQueryResponse";
			static constexpr uint8_t BatchPrefix = 0x0A;

			std::vector<ServerAddress> servers;

			// True when the batch ends with the seed address.
			bool IsLastPage() const;

			void Encode(PacketBuffer &out) const;
			static MasterServerQueryResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};
	}
}
