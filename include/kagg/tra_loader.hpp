#pragma once

/// @file include/kagg/tra_loader.hpp
/// @brief Loader for `.tra` coordinate-format transition matrices.
///
/// # Module: TraLoader
///
/// ## Expected Format
/// ```
/// 842 4911
/// 0 0 0.25
/// 0 17 0.75
/// ...
/// ```
/// The header is `<ignored> <num_transitions>`. Each of the following
/// `num_transitions` lines is `<src> <dst> <probability>` with 0-based state
/// indices. Entry (src, dst, v) becomes F(dst, src) = v of the forward
/// operator (see chain.hpp). The number of states is one more than the
/// largest index seen.
///
/// Zero probabilities are dropped, duplicate pairs are summed. Blank lines
/// and lines starting with `#` are skipped everywhere.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on any malformed input
/// - Does not modify any file or external state

#include "kagg/chain.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kagg::chain {

/// Parses `.tra` text into a `TransitionMatrix`.
class TraLoader {
public:
    TraLoader() = delete;

    /// Load a chain from a `.tra` file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or its contents are malformed
    /// - the parsed chain otherwise
    [[nodiscard]] static std::optional<TransitionMatrix>
    load(const std::string& filepath) noexcept;

    /// Parse `.tra` text held in memory (useful for testing).
    ///
    /// # Returns
    /// `nullopt` if the header is malformed, fewer transition lines than
    /// declared are present, a line has an unparseable or negative index or a
    /// non-finite or negative probability, or no nonzero transition remains.
    [[nodiscard]] static std::optional<TransitionMatrix>
    parse(std::string_view content) noexcept;
};

} // namespace kagg::chain
