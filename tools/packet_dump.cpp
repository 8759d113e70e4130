// Packet Dumper
// Decodes captured query/RCON datagrams, or reassembles the fragments of one
// split reply, and prints the resulting packets.
// Usage: sq_packet_dump [options] <file>...

#include "srcquery/util/json_config.h"  // Must be before logging.h for InitLoggingFromJson
#include "srcquery/logging.h"
#include "srcquery/config.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/net/packet_factory.h"
#include "srcquery/net/packet_reassembler.h"
#include "srcquery/util/file.h"
#include "srcquery/util/strings.h"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifndef _WIN32
void HandleSigUsr1(int /*sig*/) {
	LogLevelIncrease();
}

void HandleSigUsr2(int /*sig*/) {
	LogLevelDecrease();
}
#endif

static void PrintUsage(const char* argv0) {
	std::cout << "Usage: " << argv0 << " [options] <file>...\n";
	std::cout << "Options:\n";
	std::cout << "  --hex                    Files contain hex text instead of raw bytes\n";
	std::cout << "  --unframed               Files start at the header byte (no FF FF FF FF marker)\n";
	std::cout << "  --fragments              Files are the ordered fragments of one split reply;\n";
	std::cout << "                           '-' stands for a fragment that was not received\n";
	std::cout << "  --compressed <SIZE> <CRC>  Fragments are bzip2 compressed to SIZE bytes with CRC32 CRC\n";
	std::cout << "  -c, --config <file>      Set config file (default: srcquery.json)\n";
	std::cout << "  --log-level=LEVEL        Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
	std::cout << "  --log-module=MOD:LEVEL   Set per-module log level (e.g., REASSEMBLY:TRACE)\n";
	std::cout << "                           Modules: NET, NET_PACKET, REASSEMBLY, RCON, MASTER, CONFIG, MAIN\n";
#ifndef _WIN32
	std::cout << "  Signal SIGUSR1           Increase log level at runtime\n";
	std::cout << "  Signal SIGUSR2           Decrease log level at runtime\n";
#endif
	std::cout << "  -h, --help               Show this help message\n";
}

static bool ReadInput(const std::string& path, bool hex, SQ::Bytes& out) {
	auto result = File::GetContents(path);
	if (!result.error.empty()) {
		LOG_ERROR(MOD_MAIN, "{}", result.error);
		return false;
	}

	if (hex) {
		if (!Strings::FromHex(result.contents, out)) {
			LOG_ERROR(MOD_MAIN, "File [{}] does not contain valid hex text", path);
			return false;
		}
		return true;
	}

	out.assign(result.contents.begin(), result.contents.end());
	return true;
}

static void PrintPacket(const std::string& source, const SQ::Net::Packet& packet) {
	std::cout << source << ": " << SQ::Net::DescribePacket(packet) << std::endl;
}

int main(int argc, char* argv[]) {
	std::string config_file = "srcquery.json";
	bool hex = false;
	bool unframed = false;
	bool fragments = false;
	std::optional<uint32_t> uncompressed_size;
	uint32_t checksum = 0;
	std::vector<std::string> inputs;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--hex") {
			hex = true;
		} else if (arg == "--unframed") {
			unframed = true;
		} else if (arg == "--fragments") {
			fragments = true;
		} else if (arg == "--compressed") {
			if (i + 2 >= argc) {
				std::cerr << "--compressed needs SIZE and CRC\n";
				return 1;
			}
			uncompressed_size = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 0));
			checksum = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 0));
		} else if (arg == "--config" || arg == "-c") {
			if (i + 1 < argc) {
				config_file = argv[++i];
			}
		} else if (arg == "--help" || arg == "-h") {
			PrintUsage(argv[0]);
			return 0;
		} else if (Strings::BeginsWith(arg, "--log-")) {
			// handled by InitLogging
		} else {
			inputs.push_back(arg);
		}
	}

	if (inputs.empty()) {
		PrintUsage(argv[0]);
		return 1;
	}

	// stdout carries the decoded packets only
	LogManager::Instance().SetOutput(std::cerr);

	auto config = SQ::LoadConfig(SQ::JsonConfigFile::Load(config_file));
	// Command-line levels override the config file
	InitLogging(argc, argv);

#ifndef _WIN32
	signal(SIGUSR1, HandleSigUsr1);
	signal(SIGUSR2, HandleSigUsr2);
#endif

	LOG_INFO(MOD_MAIN, "Dumping {} input(s), fragments: {}, compressed: {}", inputs.size(), fragments, uncompressed_size.has_value());

	if (fragments) {
		SQ::Net::FragmentSet set(inputs.size());
		set.is_compressed = uncompressed_size.has_value();
		set.uncompressed_size = uncompressed_size.value_or(0);
		set.checksum = checksum;

		for (size_t i = 0; i < inputs.size(); ++i) {
			if (inputs[i] == "-") {
				continue;
			}
			SQ::Bytes data;
			if (!ReadInput(inputs[i], hex, data)) {
				return 1;
			}
			set.SetFragment(i, std::move(data));
		}

		try {
			SQ::Net::PacketReassembler reassembler(config.reassembly);
			PrintPacket("reassembled", reassembler.Reassemble(set));
		}
		catch (const SQ::Net::PacketError& ex) {
			LOG_ERROR(MOD_MAIN, "Reassembly failed ({}): {}", SQ::Net::PacketErrorKindName(ex.Kind()), ex.what());
			return ex.IsRetryable() ? 3 : 2;
		}
		return 0;
	}

	int failures = 0;
	for (const auto& input : inputs) {
		SQ::Bytes data;
		if (!ReadInput(input, hex, data)) {
			++failures;
			continue;
		}

		LOG_TRACE(MOD_MAIN, "{}:\n{}", input, Strings::HexDump(data));
		try {
			auto packet = unframed ? SQ::Net::CreatePacket(data) : SQ::Net::CreatePacketFromDatagram(data);
			PrintPacket(input, packet);
		}
		catch (const SQ::Net::PacketError& ex) {
			LOG_ERROR(MOD_MAIN, "{}: {} ({})", input, ex.what(), SQ::Net::PacketErrorKindName(ex.Kind()));
			++failures;
		}
	}

	return failures == 0 ? 0 : 2;
}
