#include "srcquery/net/master_server_packets.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/logging.h"

#include <fmt/format.h>
#include <algorithm>

bool SQ::Net::ServerAddress::IsSeed() const
{
	return ip[0] == 0 && ip[1] == 0 && ip[2] == 0 && ip[3] == 0 && port == 0;
}

std::string SQ::Net::ServerAddress::ToString() const
{
	return fmt::format("{}.{}.{}.{}:{}", ip[0], ip[1], ip[2], ip[3], port);
}

void SQ::Net::MasterServerQueryRequest::Encode(PacketBuffer &out) const
{
	out.WriteUInt8(static_cast<uint8_t>(region));
	out.WriteCString(start_address);
	out.WriteCString(filter);
}

SQ::Net::MasterServerQueryRequest SQ::Net::MasterServerQueryRequest::Decode(PacketBuffer &in)
{
	MasterServerQueryRequest r;
	r.region = static_cast<MasterRegion>(in.ReadUInt8());
	r.start_address = in.ReadCString();
	r.filter = in.ReadCString();
	return r;
}

std::string SQ::Net::MasterServerQueryRequest::Describe() const
{
	return fmt::format("MasterServerQueryRequest region={:#04x} start='{}' filter='{}'",
		static_cast<uint8_t>(region), start_address, filter);
}

bool SQ::Net::MasterServerQueryResponse::IsLastPage() const
{
	return !servers.empty() && servers.back().IsSeed();
}

void SQ::Net::MasterServerQueryResponse::Encode(PacketBuffer &out) const
{
	out.WriteUInt8(BatchPrefix);
	for (const auto &server : servers) {
		out.WriteBytes(server.ip.data(), server.ip.size());
		out.WriteUInt16BE(server.port);
	}
}

SQ::Net::MasterServerQueryResponse SQ::Net::MasterServerQueryResponse::Decode(PacketBuffer &in)
{
	uint8_t prefix = in.ReadUInt8();
	if (prefix != BatchPrefix) {
		throw MalformedPacketError(fmt::format("Master server reply starts with {:#04x} instead of {:#04x}", prefix, BatchPrefix));
	}

	// No count field: entries run to the end of the payload, six bytes each.
	MasterServerQueryResponse r;
	r.servers.reserve(in.Remaining() / 6);
	while (in.HasRemaining()) {
		ServerAddress server;
		Bytes ip = in.ReadBytes(server.ip.size());
		std::copy(ip.begin(), ip.end(), server.ip.begin());
		server.port = in.ReadUInt16BE();
		r.servers.push_back(server);
	}

	LOG_TRACE(MOD_MASTER, "MasterServerQueryResponse: {} address(es), last page: {}", r.servers.size(), r.IsLastPage());
	return r;
}

std::string SQ::Net::MasterServerQueryResponse::Describe() const
{
	std::string out = fmt::format("MasterServerQueryResponse servers={}{}", servers.size(), IsLastPage() ? " (last page)" : "");
	for (const auto &server : servers) {
		out += "\n  " + server.ToString();
	}
	return out;
}
