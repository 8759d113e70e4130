#pragma once

#include "srcquery/net/packet_buffer.h"
#include "srcquery/net/packet_headers.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SQ
{
	namespace Net
	{
		struct InfoRequest
		{
			static constexpr uint8_t Header = HEADER_A2S_INFO;
			static constexpr const char *Name = "InfoRequest";

			void Encode(PacketBuffer &out) const;
			static InfoRequest Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		/*
		 * Info reply of Source engine servers. Fields after version are
		 * only present when the server sends the extra data flag byte.
		 */
		struct SourceInfoResponse
		{
			static constexpr uint8_t Header = HEADER_S2A_INFO_SOURCE;
			static constexpr const char *Name = "SourceInfoResponse";

			// Extra data flag bits
			static constexpr uint8_t EDF_GAME_ID   = 0x01;
			static constexpr uint8_t EDF_STEAM_ID  = 0x10;
			static constexpr uint8_t EDF_KEYWORDS  = 0x20;
			static constexpr uint8_t EDF_SOURCE_TV = 0x40;
			static constexpr uint8_t EDF_PORT      = 0x80;

			uint8_t protocol = 0;
			std::string name;
			std::string map;
			std::string folder;
			std::string game;
			uint16_t app_id = 0;
			uint8_t players = 0;
			uint8_t max_players = 0;
			uint8_t bots = 0;
			char dedicated = 'd';
			char os = 'l';
			bool password = false;
			bool secure = false;
			std::string version;

			std::optional<uint16_t> port;
			std::optional<uint64_t> steam_id;
			// Either one being set emits the SourceTV block; the missing
			// half is written as 0 or "".
			std::optional<uint16_t> tv_port;
			std::optional<std::string> tv_name;
			std::optional<std::string> keywords;
			std::optional<uint64_t> game_id;

			void Encode(PacketBuffer &out) const;
			static SourceInfoResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct GoldSrcModInfo
		{
			std::string link;
			std::string download_link;
			int32_t version = 0;
			int32_t size = 0;
			bool server_only = false;
			bool custom_dll = false;
		};

		// Info reply of GoldSrc (HL1) servers.
		struct GoldSrcInfoResponse
		{
			static constexpr uint8_t Header = HEADER_S2A_INFO_GOLDSRC;
			static constexpr const char *Name = "GoldSrcInfoResponse";

			std::string address;
			std::string name;
			std::string map;
			std::string folder;
			std::string game;
			uint8_t players = 0;
			uint8_t max_players = 0;
			uint8_t protocol = 0;
			char dedicated = 'd';
			char os = 'l';
			bool password = false;
			std::optional<GoldSrcModInfo> mod;
			bool secure = false;
			uint8_t bots = 0;

			void Encode(PacketBuffer &out) const;
			static GoldSrcInfoResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct PingRequest
		{
			static constexpr uint8_t Header = HEADER_A2A_PING;
			static constexpr const char *Name = "PingRequest";

			void Encode(PacketBuffer &out) const;
			static PingRequest Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		// GoldSrc servers answer with a single zero byte, Source servers with
		// "00000000000000". The content is kept as received.
		struct PingResponse
		{
			static constexpr uint8_t Header = HEADER_A2A_ACK;
			static constexpr const char *Name = "PingResponse";

			Bytes content;

			void Encode(PacketBuffer &out) const;
			static PingResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct PlayerRequest
		{
			static constexpr uint8_t Header = HEADER_A2S_PLAYER;
			static constexpr const char *Name = "PlayerRequest";

			explicit PlayerRequest(int32_t challenge_number) : challenge(challenge_number) {}

			int32_t challenge;

			void Encode(PacketBuffer &out) const;
			static PlayerRequest Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct PlayerRecord
		{
			uint8_t index = 0;
			std::string name;
			int32_t score = 0;
			float connected_seconds = 0.0f;
		};

		struct PlayerResponse
		{
			static constexpr uint8_t Header = HEADER_S2A_PLAYER;
			static constexpr const char *Name = "PlayerResponse";

			// Encode throws MalformedPacketError past this many records.
			static constexpr size_t MaxPlayers = 0xFF;

			std::vector<PlayerRecord> players;

			void Encode(PacketBuffer &out) const;
			static PlayerResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct RulesRequest
		{
			static constexpr uint8_t Header = HEADER_A2S_RULES;
			static constexpr const char *Name = "RulesRequest";

			explicit RulesRequest(int32_t challenge_number) : challenge(challenge_number) {}

			int32_t challenge;

			void Encode(PacketBuffer &out) const;
			static RulesRequest Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct Rule
		{
			std::string name;
			std::string value;
		};

		struct RulesResponse
		{
			static constexpr uint8_t Header = HEADER_S2A_RULES;
			static constexpr const char *Name = "RulesResponse";

			static constexpr size_t MaxRules = 0xFFFF;

			std::vector<Rule> rules;

			void Encode(PacketBuffer &out) const;
			static RulesResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct ChallengeRequest
		{
			static constexpr uint8_t Header = HEADER_A2S_GETCHALLENGE;
			static constexpr const char *Name = "ChallengeRequest";

			void Encode(PacketBuffer &out) const;
			static ChallengeRequest Decode(PacketBuffer &in);
			std::string Describe() const;
		};

		struct ChallengeResponse
		{
			static constexpr uint8_t Header = HEADER_S2C_CHALLENGE;
			static constexpr const char *Name = "ChallengeResponse";

			int32_t challenge = 0;

			void Encode(PacketBuffer &out) const;
			static ChallengeResponse Decode(PacketBuffer &in);
			std::string Describe() const;
		};
	}
}
