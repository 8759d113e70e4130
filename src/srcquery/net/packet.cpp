#include "srcquery/net/packet.h"

#include <algorithm>
#include <type_traits>

bool SQ::Net::IsKnownHeader(uint8_t header)
{
	return std::find(KnownHeaders.begin(), KnownHeaders.end(), header) != KnownHeaders.end();
}

uint8_t SQ::Net::PacketHeader(const Packet &packet)
{
	return std::visit([](const auto &p) -> uint8_t { return std::decay_t<decltype(p)>::Header; }, packet);
}

const char *SQ::Net::PacketName(const Packet &packet)
{
	return std::visit([](const auto &p) -> const char * { return std::decay_t<decltype(p)>::Name; }, packet);
}

std::string SQ::Net::DescribePacket(const Packet &packet)
{
	return std::visit([](const auto &p) { return p.Describe(); }, packet);
}

SQ::Bytes SQ::Net::EncodePacket(const Packet &packet)
{
	PacketBuffer out;
	out.WriteUInt8(PacketHeader(packet));
	std::visit([&out](const auto &p) { p.Encode(out); }, packet);
	return out.Release();
}

SQ::Bytes SQ::Net::ToBytes(const Packet &packet)
{
	PacketBuffer out;
	out.WriteUInt32(SinglePacketMarker);
	out.WriteBytes(EncodePacket(packet));
	return out.Release();
}
