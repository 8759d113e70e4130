#pragma once

#include "srcquery/net/packet_buffer.h"
#include "srcquery/net/packet_headers.h"

#include <string>
#include <vector>

namespace SQ
{
	namespace Net
	{
		/*
		 * Legacy GoldSrc RCON command sent without a challenge number.
		 * The payload is the command text, carried as is.
		 */
		struct RconNoChallenge
		{
			static constexpr uint8_t Header = HEADER_RCON_GOLDSRC_NO_CHALLENGE;
			static constexpr const char *Name = "RconNoChallenge";

			std::string command;

			void Encode(PacketBuffer &out) const;
			static RconNoChallenge Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		/*
		 * Legacy GoldSrc RCON reply. Long command output arrives as several of
		 * these; Concatenate() joins them in order. This path has no
		 * compression or checksum step.
		 */
		struct RconResponse
		{
			static constexpr uint8_t Header = HEADER_RCON_GOLDSRC_RESPONSE;
			static constexpr const char *Name = "RconResponse";

			Bytes content;

			// Raw reply bytes, not decoded as text.
			const Bytes &Text() const { return content; }

			static RconResponse Concatenate(const std::vector<RconResponse> &parts);

			void Encode(PacketBuffer &out) const;
			static RconResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};
	}
}
