// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "cli_tool_impl.hpp"

#include <nybble/core/assert.h>
#include <nybble/core/likely.h>
#include <nybble/nibble/hex.hpp>
#include <nybble/nibble/nibble.hpp>
#include <nybble/nibble/nibble_sequence.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdlib>
#include <map>
#include <mutex>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    enum class NibbleFormat
    {
        Hex,
        Binary,
        Octal,
        Decimal,
    };

    std::map<std::string, nybble::NibbleOrder> const order_map = {
        {"high", nybble::NibbleOrder::HighFirst},
        {"high-first", nybble::NibbleOrder::HighFirst},
        {"low", nybble::NibbleOrder::LowFirst},
        {"low-first", nybble::NibbleOrder::LowFirst}};

    std::map<std::string, NibbleFormat> const format_map = {
        {"hex", NibbleFormat::Hex},
        {"binary", NibbleFormat::Binary},
        {"octal", NibbleFormat::Octal},
        {"decimal", NibbleFormat::Decimal}};

    std::map<std::string, quill::LogLevel> const log_level_map = {
        {"debug", quill::LogLevel::Debug},
        {"info", quill::LogLevel::Info},
        {"warning", quill::LogLevel::Warning},
        {"error", quill::LogLevel::Error},
        {"none", quill::LogLevel::None}};

    std::string
    render(nybble::Nibble const n, NibbleFormat const format, bool const pad)
    {
        switch (format) {
        case NibbleFormat::Hex:
            return std::string(1, n.to_hex_digit());
        case NibbleFormat::Binary:
            return std::string{n.to_binary_string(pad).view()};
        case NibbleFormat::Octal:
            return std::string{n.to_octal_string().view()};
        case NibbleFormat::Decimal:
            return std::string{n.to_decimal_string().view()};
        }
        NYBBLE_ABORT("unknown nibble format");
    }

    // log to stderr so stdout carries nothing but nibbles
    void start_logging(quill::LogLevel const level)
    {
        static std::once_flag once;
        std::call_once(once, [] {
            auto stderr_handler = quill::stderr_handler();
            stderr_handler->set_pattern(
                "%(time) [%(thread_id)] %(file_name):%(line_number) "
                "LOG_%(log_level)\t%(message)",
                "%Y-%m-%d %H:%M:%S.%Qns",
                quill::Timezone::GmtTime);
            quill::Config cfg;
            cfg.default_handlers.emplace_back(stderr_handler);
            quill::configure(cfg);
            quill::start(true);
        });
        quill::get_root_logger()->set_log_level(level);
    }
}

int main_impl(
    std::ostream &cout, std::ostream &cerr, std::span<std::string_view> args)
{
    using namespace nybble;

    CLI::App cli("Splits bytes into 4-bit nibbles", "nybble-cli");
    cli.option_defaults()->always_capture_default();

    std::string hex;
    NibbleOrder order = NibbleOrder::HighFirst;
    NibbleFormat format = NibbleFormat::Hex;
    bool pad = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--hex", hex, "input bytes as hex text, 0x prefix optional")
        ->required();
    cli.add_option("--order", order, "nibble produced first from each byte")
        ->transform(CLI::CheckedTransformer(order_map, CLI::ignore_case));
    cli.add_option("--format", format, "rendering of each nibble")
        ->transform(CLI::CheckedTransformer(format_map, CLI::ignore_case));
    cli.add_flag("--pad", pad, "show all four bits in binary format");
    cli.add_option("--log_level", log_level, "level of logging to stderr")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    NYBBLE_ASSERT(!args.empty());
    try {
        // CLI11 consumes a vector of arguments from the back
        std::vector<std::string> rargs(args.rbegin(), --args.rend());
        cli.parse(std::move(rargs));
    }
    catch (CLI::CallForHelp const &) {
        cout << cli.help() << std::flush;
        return EXIT_SUCCESS;
    }
    catch (CLI::ParseError const &e) {
        cerr << "FATAL: " << e.what() << "\n\n" << cli.help() << std::flush;
        return EXIT_FAILURE;
    }

    start_logging(log_level);

    auto const bytes = from_hex(hex);
    if (NYBBLE_UNLIKELY(bytes.has_error())) {
        std::string const message{bytes.error().message().c_str()};
        LOG_ERROR("invalid --hex '{}': {}", hex, message);
        cerr << "FATAL: invalid --hex '" << hex << "': " << message
             << std::endl;
        return EXIT_FAILURE;
    }

    NibbleSequence seq{bytes.value(), order};
    LOG_INFO(
        "splitting {} bytes into {} nibbles, {} first",
        seq.source().size(),
        seq.size(),
        order == NibbleOrder::HighFirst ? "high" : "low");

    while (auto const n = seq.next()) {
        cout << render(*n, format, pad) << '\n';
    }
    cout << std::flush;

    LOG_DEBUG("done, {} nibbles remaining", seq.remaining());
    return EXIT_SUCCESS;
}
