#include "fixpack/fixpack.hpp"
#include "device_protocol.hpp"
#include "messages.hpp"
#include "hex.hpp"

#include <CLI/CLI.hpp>
#include "replxx.hxx"

#include <cctype>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {
	using namespace fixpackctl;

	std::vector<std::string> split_command(const std::string& line) {
		std::vector<std::string> args;
		std::string current;
		bool in_quotes = false;
		bool escaped = false;

		for (char ch : line) {
			if (escaped) {
				current += ch;
				escaped = false;
			}
			else if (ch == '\\') {
				escaped = true;
			}
			else if (ch == '"') {
				in_quotes = !in_quotes;
			}
			else if (std::isspace(static_cast<unsigned char>(ch)) && !in_quotes) {
				if (!current.empty()) {
					args.push_back(current);
					current.clear();
				}
			}
			else {
				current += ch;
			}
		}

		if (!current.empty()) {
			args.push_back(current);
		}

		return args;
	}

	std::string join(const std::vector<std::string>& parts, std::size_t from) {
		std::string result;
		for (std::size_t i = from; i < parts.size(); ++i) {
			result += parts[i];
		}
		return result;
	}

	int cmd_sizes() {
		using namespace fixpack;
		std::cout << "request         max " << max_size_v<protocol::request> << " bytes\n";
		std::cout << "  ping          " << max_size_v<protocol::ping> << "\n";
		std::cout << "  set_led       " << max_size_v<protocol::set_led> << "\n";
		std::cout << "  read_sensor   " << max_size_v<protocol::read_sensor> << "\n";
		std::cout << "  reset         " << max_size_v<protocol::reset> << "\n";
		std::cout << "response        max " << max_size_v<protocol::response> << " bytes\n";
		std::cout << "  pong          " << max_size_v<protocol::pong> << "\n";
		std::cout << "  ack           " << max_size_v<protocol::ack> << "\n";
		std::cout << "  sensor_reading " << max_size_v<protocol::sensor_reading> << "\n";
		std::cout << "  fault         " << max_size_v<protocol::fault> << "\n";
		return 0;
	}

	template <typename MessageT>
	int encode_message(const MessageT& msg, std::optional<std::size_t> buffer_size) {
		fixpack::core::byte_buffer buffer(buffer_size.value_or(fixpack::max_size_v<MessageT>));
		std::error_code ec;
		const auto written = fixpack::serialize(msg, fixpack::byte_span(buffer), ec);
		if (ec) {
			std::cerr << "Encoding failed: " << ec.message()
				<< " (buffer " << buffer.size() << " bytes, needs " << fixpack::encoded_size(msg) << ")\n";
			return 1;
		}
		std::cout << describe(msg) << "\n";
		std::cout << hex::format(fixpack::byte_view(buffer.data(), written))
			<< "  (" << written << " of max " << fixpack::max_size_v<MessageT> << " bytes)\n";
		return 0;
	}

	int cmd_encode(const std::string& kind, const std::vector<std::string>& message, std::optional<std::size_t> buffer_size) {
		try {
			if (kind == "request") {
				return encode_message(parse_request(message), buffer_size);
			}
			if (kind == "response") {
				return encode_message(parse_response(message), buffer_size);
			}
			std::cerr << "Unknown message kind: " << kind << " (expected request or response)\n";
			return 1;
		}
		catch (const std::exception& e) {
			std::cerr << "Error encoding message: " << e.what() << "\n";
			return 1;
		}
	}

	template <typename MessageT>
	int decode_message(fixpack::byte_view data) {
		std::error_code ec;
		auto [msg, rest] = fixpack::deserialize<MessageT>(data, ec);
		if (ec) {
			std::cerr << "Decoding failed: " << ec.message() << "\n";
			return 1;
		}
		std::cout << describe(msg) << "\n";
		std::cout << "consumed " << (data.size() - rest.size()) << " bytes, remainder " << rest.size() << " bytes";
		if (!rest.empty()) {
			std::cout << ": " << hex::format(rest);
		}
		std::cout << "\n";
		return 0;
	}

	int cmd_decode(const std::string& kind, const std::string& hex_text) {
		const auto data = hex::parse(hex_text);
		if (!data) {
			std::cerr << "Invalid hex input: " << hex_text << "\n";
			return 1;
		}
		if (kind == "request") {
			return decode_message<protocol::request>(*data);
		}
		if (kind == "response") {
			return decode_message<protocol::response>(*data);
		}
		std::cerr << "Unknown message kind: " << kind << " (expected request or response)\n";
		return 1;
	}

	void cmd_help() {
		std::cout << "\nfixpackctl Available Commands:\n";
		std::cout << "  sizes                              - Show maximum encoded sizes\n";
		std::cout << "  encode <request|response> <msg...> - Encode a message, e.g. encode request set_led 3 on\n";
		std::cout << "  decode <request|response> <hex>    - Decode hex bytes, e.g. decode request 01 03 01\n";
		std::cout << "  help                               - Show this help\n";
		std::cout << "  exit/quit                          - Exit shell\n\n";
	}
}

void shell_mode(std::optional<std::size_t> buffer_size) {
	replxx::Replxx rx;
	rx.set_max_history_size(128);

	std::cout << "fixpackctl shell\n";
	std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

	while (true) {
		const char* input = rx.input("fixpack> ");
		if (!input) break;

		std::string line(input);
		if (line.empty()) continue;
		if (line == "exit" || line == "quit") break;

		std::vector<std::string> args = split_command(line);
		if (args.empty()) continue;

		const auto& cmd = args[0];

		if (cmd == "help") {
			cmd_help();
		}
		else if (cmd == "sizes") {
			cmd_sizes();
		}
		else if (cmd == "encode") {
			if (args.size() > 2) {
				cmd_encode(args[1], std::vector<std::string>(args.begin() + 2, args.end()), buffer_size);
			}
			else {
				std::cerr << "Usage: encode <request|response> <variant> [fields...]\n";
			}
		}
		else if (cmd == "decode") {
			if (args.size() > 2) {
				cmd_decode(args[1], join(args, 2));
			}
			else {
				std::cerr << "Usage: decode <request|response> <hex>\n";
			}
		}
		else {
			std::cerr << "Unknown command: " << cmd << " (type 'help' for available commands)\n";
		}

		rx.history_add(line);
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "fixpackctl - fixed-size message inspector" };

	app.require_subcommand(1);

	std::string kind;
	std::vector<std::string> message;
	std::vector<std::string> hex_parts;
	std::optional<std::size_t> buffer_size;
	int result = 0;

	app.add_option("--buffer", buffer_size, "Encode into a buffer of this many bytes instead of the type's maximum");

	auto sizes_cmd = app.add_subcommand("sizes", "Show maximum encoded sizes");
	sizes_cmd->callback([&]() {
		result = cmd_sizes();
		});

	auto encode_cmd = app.add_subcommand("encode", "Encode a message and print it as hex");
	encode_cmd->add_option("kind", kind, "request or response")->required()->check(CLI::IsMember({ "request", "response" }));
	encode_cmd->add_option("message", message, "Variant name followed by its fields")->required();
	encode_cmd->callback([&]() {
		result = cmd_encode(kind, message, buffer_size);
		});

	auto decode_cmd = app.add_subcommand("decode", "Decode hex bytes into a message");
	decode_cmd->add_option("kind", kind, "request or response")->required()->check(CLI::IsMember({ "request", "response" }));
	decode_cmd->add_option("hex", hex_parts, "Encoded bytes as hex, spaces allowed")->required();
	decode_cmd->callback([&]() {
		result = cmd_decode(kind, join(hex_parts, 0));
		});

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell mode");
	shell_cmd->callback([&]() {
		shell_mode(buffer_size);
		});

	CLI11_PARSE(app, argc, argv);

	return result;
}
