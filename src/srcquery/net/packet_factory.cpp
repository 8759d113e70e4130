#include "srcquery/net/packet_factory.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/util/strings.h"
#include "srcquery/logging.h"

namespace
{
	SQ::Net::Packet DecodePayload(uint8_t header, SQ::Net::PacketBuffer &in)
	{
		using namespace SQ::Net;

		switch (header) {
		case InfoRequest::Header:
			return InfoRequest::Decode(in);
		case SourceInfoResponse::Header:
			return SourceInfoResponse::Decode(in);
		case GoldSrcInfoResponse::Header:
			return GoldSrcInfoResponse::Decode(in);
		case PingRequest::Header:
			return PingRequest::Decode(in);
		case PingResponse::Header:
			return PingResponse::Decode(in);
		case PlayerRequest::Header:
			return PlayerRequest::Decode(in);
		case PlayerResponse::Header:
			return PlayerResponse::Decode(in);
		case RulesRequest::Header:
			return RulesRequest::Decode(in);
		case RulesResponse::Header:
			return RulesResponse::Decode(in);
		case ChallengeRequest::Header:
			return ChallengeRequest::Decode(in);
		case ChallengeResponse::Header:
			return ChallengeResponse::Decode(in);
		case MasterServerQueryRequest::Header:
			return MasterServerQueryRequest::Decode(in);
		case MasterServerQueryResponse::Header:
			return MasterServerQueryResponse::Decode(in);
		case RconNoChallenge::Header:
			return RconNoChallenge::Decode(in);
		case RconResponse::Header:
			return RconResponse::Decode(in);
		default:
			throw UnknownHeaderError(header);
		}
	}
}

SQ::Net::Packet SQ::Net::CreatePacket(const Bytes &raw)
{
	if (raw.empty()) {
		throw UnderrunError(1, 0);
	}

	uint8_t header = raw[0];
	PacketBuffer in(raw.data() + 1, raw.size() - 1);

	LOG_TRACE(MOD_NET_PACKET, "CreatePacket: header={:#04x} payload={} byte(s) [{}]", header, in.Length(), Strings::ToHex(raw, 32));
	try {
		Packet packet = DecodePayload(header, in);
		LOG_DEBUG(MOD_NET_PACKET, "Decoded {} ({} byte(s))", PacketName(packet), raw.size());
		return packet;
	}
	catch (const PacketError &ex) {
		LOG_DEBUG(MOD_NET_PACKET, "Failed to decode packet with header {:#04x}: {}", header, ex.what());
		throw;
	}
}

SQ::Net::Packet SQ::Net::CreatePacketFromDatagram(const Bytes &datagram)
{
	if (datagram.size() < WireMarkerSize + 1) {
		throw UnderrunError(WireMarkerSize + 1, datagram.size());
	}

	PacketBuffer frame(datagram.data(), WireMarkerSize);
	uint32_t marker = frame.ReadUInt32();
	if (marker != SinglePacketMarker) {
		LOG_WARN(MOD_NET, "Datagram of {} byte(s) rejected, marker {:#010x}", datagram.size(), marker);
		throw InvalidFrameError(marker);
	}

	return CreatePacket(Bytes(datagram.begin() + WireMarkerSize, datagram.end()));
}
