#include "srcquery/net/query_packets.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/logging.h"

#include <fmt/format.h>
#include <utility>

// Request packets without a body encode to the bare header and ignore
// whatever trails it on decode.

void SQ::Net::InfoRequest::Encode(PacketBuffer &out) const
{
	(void)out;
}

SQ::Net::InfoRequest SQ::Net::InfoRequest::Decode(PacketBuffer &in)
{
	(void)in;
	return InfoRequest{};
}

std::string SQ::Net::InfoRequest::Describe() const
{
	return "InfoRequest";
}

void SQ::Net::SourceInfoResponse::Encode(PacketBuffer &out) const
{
	out.WriteUInt8(protocol);
	out.WriteCString(name);
	out.WriteCString(map);
	out.WriteCString(folder);
	out.WriteCString(game);
	out.WriteUInt16(app_id);
	out.WriteUInt8(players);
	out.WriteUInt8(max_players);
	out.WriteUInt8(bots);
	out.WriteUInt8(static_cast<uint8_t>(dedicated));
	out.WriteUInt8(static_cast<uint8_t>(os));
	out.WriteUInt8(password ? 1 : 0);
	out.WriteUInt8(secure ? 1 : 0);
	out.WriteCString(version);

	uint8_t edf = 0;
	if (port) edf |= EDF_PORT;
	if (steam_id) edf |= EDF_STEAM_ID;
	if (tv_port || tv_name) edf |= EDF_SOURCE_TV;
	if (keywords) edf |= EDF_KEYWORDS;
	if (game_id) edf |= EDF_GAME_ID;
	if (edf == 0) {
		return;
	}

	out.WriteUInt8(edf);
	if (port) {
		out.WriteUInt16(*port);
	}
	if (steam_id) {
		out.WriteUInt64(*steam_id);
	}
	if (edf & EDF_SOURCE_TV) {
		out.WriteUInt16(tv_port.value_or(0));
		out.WriteCString(tv_name.value_or(""));
	}
	if (keywords) {
		out.WriteCString(*keywords);
	}
	if (game_id) {
		out.WriteUInt64(*game_id);
	}
}

SQ::Net::SourceInfoResponse SQ::Net::SourceInfoResponse::Decode(PacketBuffer &in)
{
	SourceInfoResponse r;
	r.protocol = in.ReadUInt8();
	r.name = in.ReadCString();
	r.map = in.ReadCString();
	r.folder = in.ReadCString();
	r.game = in.ReadCString();
	r.app_id = in.ReadUInt16();
	r.players = in.ReadUInt8();
	r.max_players = in.ReadUInt8();
	r.bots = in.ReadUInt8();
	r.dedicated = static_cast<char>(in.ReadUInt8());
	r.os = static_cast<char>(in.ReadUInt8());
	r.password = in.ReadUInt8() != 0;
	r.secure = in.ReadUInt8() != 0;
	r.version = in.ReadCString();

	if (!in.HasRemaining()) {
		return r;
	}

	uint8_t edf = in.ReadUInt8();
	LOG_TRACE(MOD_NET_PACKET, "SourceInfoResponse: extra data flags {:#04x}", edf);
	if (edf & EDF_PORT) {
		r.port = in.ReadUInt16();
	}
	if (edf & EDF_STEAM_ID) {
		r.steam_id = in.ReadUInt64();
	}
	if (edf & EDF_SOURCE_TV) {
		r.tv_port = in.ReadUInt16();
		r.tv_name = in.ReadCString();
	}
	if (edf & EDF_KEYWORDS) {
		r.keywords = in.ReadCString();
	}
	if (edf & EDF_GAME_ID) {
		r.game_id = in.ReadUInt64();
	}
	return r;
}

std::string SQ::Net::SourceInfoResponse::Describe() const
{
	return fmt::format("SourceInfoResponse name='{}' map='{}' game='{}' app={} players={}/{} bots={} version='{}'",
		name, map, game, app_id, players, max_players, bots, version);
}

void SQ::Net::GoldSrcInfoResponse::Encode(PacketBuffer &out) const
{
	out.WriteCString(address);
	out.WriteCString(name);
	out.WriteCString(map);
	out.WriteCString(folder);
	out.WriteCString(game);
	out.WriteUInt8(players);
	out.WriteUInt8(max_players);
	out.WriteUInt8(protocol);
	out.WriteUInt8(static_cast<uint8_t>(dedicated));
	out.WriteUInt8(static_cast<uint8_t>(os));
	out.WriteUInt8(password ? 1 : 0);
	out.WriteUInt8(mod ? 1 : 0);
	if (mod) {
		out.WriteCString(mod->link);
		out.WriteCString(mod->download_link);
		out.WriteUInt8(0);
		out.WriteInt32(mod->version);
		out.WriteInt32(mod->size);
		out.WriteUInt8(mod->server_only ? 1 : 0);
		out.WriteUInt8(mod->custom_dll ? 1 : 0);
	}
	out.WriteUInt8(secure ? 1 : 0);
	out.WriteUInt8(bots);
}

SQ::Net::GoldSrcInfoResponse SQ::Net::GoldSrcInfoResponse::Decode(PacketBuffer &in)
{
	GoldSrcInfoResponse r;
	r.address = in.ReadCString();
	r.name = in.ReadCString();
	r.map = in.ReadCString();
	r.folder = in.ReadCString();
	r.game = in.ReadCString();
	r.players = in.ReadUInt8();
	r.max_players = in.ReadUInt8();
	r.protocol = in.ReadUInt8();
	r.dedicated = static_cast<char>(in.ReadUInt8());
	r.os = static_cast<char>(in.ReadUInt8());
	r.password = in.ReadUInt8() != 0;

	if (in.ReadUInt8() != 0) {
		GoldSrcModInfo mod;
		mod.link = in.ReadCString();
		mod.download_link = in.ReadCString();
		in.ReadUInt8(); // reserved
		mod.version = in.ReadInt32();
		mod.size = in.ReadInt32();
		mod.server_only = in.ReadUInt8() != 0;
		mod.custom_dll = in.ReadUInt8() != 0;
		r.mod = mod;
	}

	r.secure = in.ReadUInt8() != 0;
	r.bots = in.ReadUInt8();
	return r;
}

std::string SQ::Net::GoldSrcInfoResponse::Describe() const
{
	return fmt::format("GoldSrcInfoResponse address='{}' name='{}' map='{}' game='{}' players={}/{} mod={}",
		address, name, map, game, players, max_players, mod ? "yes" : "no");
}

void SQ::Net::PingRequest::Encode(PacketBuffer &out) const
{
	(void)out;
}

SQ::Net::PingRequest SQ::Net::PingRequest::Decode(PacketBuffer &in)
{
	(void)in;
	return PingRequest{};
}

std::string SQ::Net::PingRequest::Describe() const
{
	return "PingRequest";
}

void SQ::Net::PingResponse::Encode(PacketBuffer &out) const
{
	out.WriteBytes(content);
}

SQ::Net::PingResponse SQ::Net::PingResponse::Decode(PacketBuffer &in)
{
	PingResponse r;
	r.content = in.ReadRemaining();
	return r;
}

std::string SQ::Net::PingResponse::Describe() const
{
	return fmt::format("PingResponse content={} byte(s)", content.size());
}

void SQ::Net::PlayerRequest::Encode(PacketBuffer &out) const
{
	out.WriteInt32(challenge);
}

SQ::Net::PlayerRequest SQ::Net::PlayerRequest::Decode(PacketBuffer &in)
{
	return PlayerRequest(in.ReadInt32());
}

std::string SQ::Net::PlayerRequest::Describe() const
{
	return fmt::format("PlayerRequest challenge={}", challenge);
}

void SQ::Net::PlayerResponse::Encode(PacketBuffer &out) const
{
	if (players.size() > MaxPlayers) {
		throw MalformedPacketError(fmt::format("PlayerResponse holds {} players, the count byte allows {}", players.size(), MaxPlayers));
	}

	out.WriteUInt8(static_cast<uint8_t>(players.size()));
	for (const auto &player : players) {
		out.WriteUInt8(player.index);
		out.WriteCString(player.name);
		out.WriteInt32(player.score);
		out.WriteFloat(player.connected_seconds);
	}
}

SQ::Net::PlayerResponse SQ::Net::PlayerResponse::Decode(PacketBuffer &in)
{
	PlayerResponse r;
	uint8_t count = in.ReadUInt8();
	r.players.reserve(count);
	for (uint8_t i = 0; i < count; ++i) {
		PlayerRecord player;
		player.index = in.ReadUInt8();
		player.name = in.ReadCString();
		player.score = in.ReadInt32();
		player.connected_seconds = in.ReadFloat();
		r.players.push_back(std::move(player));
	}

	if (in.HasRemaining()) {
		LOG_TRACE(MOD_NET_PACKET, "PlayerResponse: ignoring {} trailing byte(s) after {} player(s)", in.Remaining(), count);
	}
	return r;
}

std::string SQ::Net::PlayerResponse::Describe() const
{
	std::string out = fmt::format("PlayerResponse players={}", players.size());
	for (const auto &player : players) {
		out += fmt::format("\n  #{} '{}' score={} time={:.1f}s", player.index, player.name, player.score, player.connected_seconds);
	}
	return out;
}

void SQ::Net::RulesRequest::Encode(PacketBuffer &out) const
{
	out.WriteInt32(challenge);
}

SQ::Net::RulesRequest SQ::Net::RulesRequest::Decode(PacketBuffer &in)
{
	return RulesRequest(in.ReadInt32());
}

std::string SQ::Net::RulesRequest::Describe() const
{
	return fmt::format("RulesRequest challenge={}", challenge);
}

void SQ::Net::RulesResponse::Encode(PacketBuffer &out) const
{
	if (rules.size() > MaxRules) {
		throw MalformedPacketError(fmt::format("RulesResponse holds {} rules, the count field allows {}", rules.size(), MaxRules));
	}

	out.WriteUInt16(static_cast<uint16_t>(rules.size()));
	for (const auto &rule : rules) {
		out.WriteCString(rule.name);
		out.WriteCString(rule.value);
	}
}

SQ::Net::RulesResponse SQ::Net::RulesResponse::Decode(PacketBuffer &in)
{
	RulesResponse r;
	uint16_t count = in.ReadUInt16();
	r.rules.reserve(count);
	for (uint16_t i = 0; i < count; ++i) {
		Rule rule;
		rule.name = in.ReadCString();
		rule.value = in.ReadCString();
		r.rules.push_back(std::move(rule));
	}

	if (in.HasRemaining()) {
		LOG_TRACE(MOD_NET_PACKET, "RulesResponse: ignoring {} trailing byte(s) after {} rule(s)", in.Remaining(), count);
	}
	return r;
}

std::string SQ::Net::RulesResponse::Describe() const
{
	std::string out = fmt::format("RulesResponse rules={}", rules.size());
	for (const auto &rule : rules) {
		out += fmt::format("\n  {} = {}", rule.name, rule.value);
	}
	return out;
}

void SQ::Net::ChallengeRequest::Encode(PacketBuffer &out) const
{
	(void)out;
}

SQ::Net::ChallengeRequest SQ::Net::ChallengeRequest::Decode(PacketBuffer &in)
{
	(void)in;
	return ChallengeRequest{};
}

std::string SQ::Net::ChallengeRequest::Describe() const
{
	return "ChallengeRequest";
}

void SQ::Net::ChallengeResponse::Encode(PacketBuffer &out) const
{
	out.WriteInt32(challenge);
}

SQ::Net::ChallengeResponse SQ::Net::ChallengeResponse::Decode(PacketBuffer &in)
{
	ChallengeResponse r;
	r.challenge = in.ReadInt32();
	return r;
}

std::string SQ::Net::ChallengeResponse::Describe() const
{
	return fmt::format("ChallengeResponse challenge={}", challenge);
}
