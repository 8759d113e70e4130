#pragma once

#include "srcquery/net/packet.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace SQ
{
	namespace Net
	{
		/*
		 * Fragments of one split reply, in sequence order. Slots are filled as
		 * datagrams arrive, in any order; an empty slot is a fragment that has
		 * not been received yet.
		 */
		struct FragmentSet
		{
			FragmentSet() = default;
			explicit FragmentSet(size_t fragment_count) : fragments(fragment_count) {}

			std::vector<std::optional<Bytes>> fragments;
			bool is_compressed = false;
			// Only meaningful when is_compressed is set.
			uint32_t uncompressed_size = 0;
			uint32_t checksum = 0;

			// Throws std::out_of_range for an index past the fragment count.
			void SetFragment(size_t index, Bytes data);
			size_t Count() const { return fragments.size(); }
			bool IsComplete() const;
		};

		struct ReassemblerOptions
		{
			// Largest uncompressed_size accepted from the wire.
			uint32_t max_uncompressed_size = 1024 * 1024;
		};

		typedef std::function<Packet(const Bytes &)> PacketDispatch;

		class PacketReassembler
		{
		public:
			PacketReassembler();
			explicit PacketReassembler(const ReassemblerOptions &opts);
			PacketReassembler(const ReassemblerOptions &opts, PacketDispatch dispatch);

			/*
			 * Joins the fragments, decompresses and verifies them when the set
			 * is compressed, and decodes the result through the dispatch
			 * function (CreatePacket by default).
			 *
			 * Throws IncompletePacketError, DecompressionError or
			 * ChecksumMismatchError; errors from the dispatch propagate as is.
			 * Dispatch is never called when any step fails.
			 */
			Packet Reassemble(const FragmentSet &fragments) const;

			// Steps before dispatch: the verified logical payload.
			Bytes ReassemblePayload(const FragmentSet &fragments) const;

			const ReassemblerOptions &GetOptions() const { return m_options; }
		private:
			ReassemblerOptions m_options;
			PacketDispatch m_dispatch;
		};
	}
}
