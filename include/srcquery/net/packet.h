#pragma once

#include "srcquery/net/master_server_packets.h"
#include "srcquery/net/packet_buffer.h"
#include "srcquery/net/query_packets.h"
#include "srcquery/net/rcon_packets.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace SQ
{
	namespace Net
	{
		// Every packet the engine knows. Adding a type here requires a case in
		// CreatePacket(); the header table below is derived from this list.
		using Packet = std::variant<
			InfoRequest,
			SourceInfoResponse,
			GoldSrcInfoResponse,
			PingRequest,
			PingResponse,
			PlayerRequest,
			PlayerResponse,
			RulesRequest,
			RulesResponse,
			ChallengeRequest,
			ChallengeResponse,
			MasterServerQueryRequest,
			MasterServerQueryResponse,
			RconNoChallenge,
			RconResponse
		>;

		namespace detail
		{
			template<typename V>
			struct VariantHeaders;

			template<typename... Ts>
			struct VariantHeaders<std::variant<Ts...>>
			{
				static constexpr std::array<uint8_t, sizeof...(Ts)> value = { Ts::Header... };
			};

			template<size_t N>
			constexpr bool HeadersUnique(const std::array<uint8_t, N> &headers)
			{
				for (size_t i = 0; i < N; ++i) {
					for (size_t j = i + 1; j < N; ++j) {
						if (headers[i] == headers[j]) {
							return false;
						}
					}
				}
				return true;
			}
		}

		constexpr auto KnownHeaders = detail::VariantHeaders<Packet>::value;
		static_assert(detail::HeadersUnique(KnownHeaders), "packet header bytes must be unique");
		static_assert(KnownHeaders.size() == std::variant_size_v<Packet>, "one header per packet type");

		bool IsKnownHeader(uint8_t header);

		uint8_t PacketHeader(const Packet &packet);
		const char *PacketName(const Packet &packet);
		std::string DescribePacket(const Packet &packet);

		// Header byte and payload, without the wire marker.
		Bytes EncodePacket(const Packet &packet);

		// Full wire frame: FF FF FF FF, header byte, payload.
		Bytes ToBytes(const Packet &packet);
	}
}
