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

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/config.hpp>
#include <stakepool/core/fmt/bytes_fmt.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/core/log_level_map.hpp>
#include <stakepool/pool/fmt/exchange_rate_fmt.hpp>
#include <stakepool/pool/pool.hpp>
#include <stakepool/pool/pool_codec.hpp>
#include <stakepool/pool/pool_state.hpp>
#include <stakepool/pool/validator.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

STAKEPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace stakepool::pool;

void log_layout(PoolState const &state)
{
    LOG_INFO(
        "version {}, manager {}, share mint {}",
        static_cast<unsigned>(state.version),
        state.manager,
        state.share_mint);
    LOG_INFO(
        "validators {}/{} ({} active), maintainers {}/{}",
        state.validators.size(),
        state.validators.capacity(),
        count_active(state.validators),
        state.maintainers.size(),
        state.maintainers.capacity());
    LOG_INFO(
        "header {} bytes, validator region {} bytes, maintainer region {} "
        "bytes, total {} bytes",
        PoolState::HEADER_SIZE,
        Validators::required_bytes(state.validators.capacity()),
        Maintainers::required_bytes(state.maintainers.capacity()),
        state.required_bytes());
    LOG_INFO("exchange rate {}", state.exchange_rate);
}

// Number of validators that fit in an account of buffer_size bytes next to
// max_maintainers maintainers
size_t
validator_capacity(size_t const buffer_size, size_t const max_maintainers)
{
    size_t const fixed =
        PoolState::HEADER_SIZE + Maintainers::required_bytes(max_maintainers);
    if (buffer_size < fixed) {
        return 0;
    }
    return Validators::maximum_entries(buffer_size - fixed);
}

std::optional<stakepool::byte_string>
read_file(std::filesystem::path const &path)
{
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return std::nullopt;
    }
    return stakepool::byte_string(
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{});
}

STAKEPOOL_ANONYMOUS_NAMESPACE_END

using namespace stakepool;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"stakepool"};
    cli.option_defaults()->always_capture_default();

    pool::PoolConfig config{
        .reward_distribution =
            {.treasury_fee = 5,
             .validation_fee = 3,
             .developer_fee = 2,
             .appreciation = 90},
        .max_validators = 64,
        .max_maintainers = 16,
    };
    size_t buffer_size = 0;
    fs::path input;
    fs::path output;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
        "--max_validators", config.max_validators, "validator capacity");
    cli.add_option(
        "--max_maintainers", config.max_maintainers, "maintainer capacity");
    cli.add_option(
        "--treasury_fee",
        config.reward_distribution.treasury_fee,
        "treasury share of rewards");
    cli.add_option(
        "--validation_fee",
        config.reward_distribution.validation_fee,
        "validators' share of rewards");
    cli.add_option(
        "--developer_fee",
        config.reward_distribution.developer_fee,
        "developer share of rewards");
    cli.add_option(
        "--appreciation",
        config.reward_distribution.appreciation,
        "share of rewards that stays in the pool");
    cli.add_option(
        "--buffer_size",
        buffer_size,
        "report how many validators fit in an account of this size");
    cli.add_option("--input", input, "load an encoded pool state")
        ->check(CLI::ExistingFile);
    cli.add_option("--output", output, "write the encoded pool state");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) %(file_name):%(line_number) LOG_%(log_level)\t%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const state = [&]() -> Result<pool::PoolState> {
        if (!input.empty()) {
            auto const encoded = read_file(input);
            if (STAKEPOOL_UNLIKELY(!encoded.has_value())) {
                LOG_ERROR("could not read {}", input.string());
                return pool::PoolError::InvalidAccountInfo;
            }
            LOG_INFO("loading pool state from {}", input.string());
            return pool::decode_pool_state(*encoded);
        }
        return pool::StakePool::initialize(config);
    }();
    if (STAKEPOOL_UNLIKELY(state.has_error())) {
        LOG_ERROR(
            "failed to load pool state: {}",
            state.assume_error().message().c_str());
        return 1;
    }
    log_layout(state.assume_value());

    if (buffer_size != 0) {
        LOG_INFO(
            "an account of {} bytes holds {} validators next to {} "
            "maintainers",
            buffer_size,
            validator_capacity(
                buffer_size, state.assume_value().maintainers.capacity()),
            state.assume_value().maintainers.capacity());
    }

    if (!output.empty()) {
        auto const encoded = pool::encode_pool_state(state.assume_value());
        std::ofstream out{output, std::ios::binary};
        out.write(
            reinterpret_cast<char const *>(encoded.data()),
            static_cast<std::streamsize>(encoded.size()));
        if (STAKEPOOL_UNLIKELY(!out)) {
            LOG_ERROR("could not write {}", output.string());
            return 1;
        }
        LOG_INFO("wrote {} bytes to {}", encoded.size(), output.string());
    }

    return 0;
}
