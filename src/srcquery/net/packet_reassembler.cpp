#include "srcquery/net/packet_reassembler.h"
#include "srcquery/net/compression.h"
#include "srcquery/net/crc32.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/net/packet_factory.h"
#include "srcquery/logging.h"

#include <fmt/format.h>
#include <stdexcept>
#include <utility>

void SQ::Net::FragmentSet::SetFragment(size_t index, Bytes data)
{
	if (index >= fragments.size()) {
		throw std::out_of_range(fmt::format("Fragment index {} outside a set of {}", index, fragments.size()));
	}
	fragments[index] = std::move(data);
}

bool SQ::Net::FragmentSet::IsComplete() const
{
	for (const auto &fragment : fragments) {
		if (!fragment) {
			return false;
		}
	}
	return true;
}

SQ::Net::PacketReassembler::PacketReassembler()
	: PacketReassembler(ReassemblerOptions())
{
}

SQ::Net::PacketReassembler::PacketReassembler(const ReassemblerOptions &opts)
	: PacketReassembler(opts, CreatePacket)
{
}

SQ::Net::PacketReassembler::PacketReassembler(const ReassemblerOptions &opts, PacketDispatch dispatch)
	: m_options(opts), m_dispatch(std::move(dispatch))
{
}

SQ::Bytes SQ::Net::PacketReassembler::ReassemblePayload(const FragmentSet &set) const
{
	size_t total = 0;
	for (size_t i = 0; i < set.fragments.size(); ++i) {
		if (!set.fragments[i]) {
			LOG_DEBUG(MOD_REASSEMBLY, "Fragment {} of {} missing, cannot reassemble yet", i, set.fragments.size());
			throw IncompletePacketError(i, set.fragments.size());
		}
		total += set.fragments[i]->size();
	}

	Bytes joined;
	joined.reserve(total);
	for (const auto &fragment : set.fragments) {
		joined.insert(joined.end(), fragment->begin(), fragment->end());
	}

	LOG_TRACE(MOD_REASSEMBLY, "FRAG_COMPLETE fragments={} len={} compressed={}", set.fragments.size(), joined.size(), set.is_compressed);

	if (!set.is_compressed) {
		return joined;
	}

	if (set.uncompressed_size > m_options.max_uncompressed_size) {
		throw DecompressionError(fmt::format("Declared uncompressed size {} exceeds limit of {}",
			set.uncompressed_size, m_options.max_uncompressed_size));
	}

	Bytes payload = Bzip2Decompress(joined, set.uncompressed_size);

	uint32_t calculated = Crc32(payload.data(), payload.size());
	if (calculated != set.checksum) {
		LOG_WARN(MOD_REASSEMBLY, "DROPPED_CRC len={} expected={:#010x} calculated={:#010x}", payload.size(), set.checksum, calculated);
		throw ChecksumMismatchError(set.checksum, calculated);
	}

	LOG_TRACE(MOD_REASSEMBLY, "FRAG_DECOMPRESSED {} -> {} bytes, crc={:#010x}", joined.size(), payload.size(), calculated);
	return payload;
}

SQ::Net::Packet SQ::Net::PacketReassembler::Reassemble(const FragmentSet &set) const
{
	Bytes payload = ReassemblePayload(set);
	return m_dispatch(payload);
}
