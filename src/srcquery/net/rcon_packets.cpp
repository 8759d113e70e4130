#include "srcquery/net/rcon_packets.h"
#include "srcquery/logging.h"

#include <fmt/format.h>

void SQ::Net::RconNoChallenge::Encode(PacketBuffer &out) const
{
	out.WriteBytes(reinterpret_cast<const uint8_t *>(command.data()), command.size());
}

SQ::Net::RconNoChallenge SQ::Net::RconNoChallenge::Decode(PacketBuffer &in)
{
	Bytes text = in.ReadRemaining();
	RconNoChallenge r;
	r.command.assign(text.begin(), text.end());
	return r;
}

std::string SQ::Net::RconNoChallenge::Describe() const
{
	return fmt::format("RconNoChallenge command='{}'", command);
}

SQ::Net::RconResponse SQ::Net::RconResponse::Concatenate(const std::vector<RconResponse> &parts)
{
	RconResponse joined;
	for (const auto &part : parts) {
		joined.content.insert(joined.content.end(), part.content.begin(), part.content.end());
	}

	LOG_DEBUG(MOD_RCON, "Concatenated {} RCON response part(s) into {} byte(s)", parts.size(), joined.content.size());
	return joined;
}

void SQ::Net::RconResponse::Encode(PacketBuffer &out) const
{
	out.WriteBytes(content);
}

SQ::Net::RconResponse SQ::Net::RconResponse::Decode(PacketBuffer &in)
{
	RconResponse r;
	r.content = in.ReadRemaining();
	return r;
}

std::string SQ::Net::RconResponse::Describe() const
{
	return fmt::format("RconResponse {} byte(s)\n{}", content.size(), std::string(content.begin(), content.end()));
}
