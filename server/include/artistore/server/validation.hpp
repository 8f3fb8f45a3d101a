/**
 * artistore - Ordered, short-circuiting validation of candidate files and chunks.
 *
 * A pipeline is a list of independent checks. It stops at the first failing
 * check and reports that check's reason. Soft warnings are collected but never
 * stop the pipeline.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "artistore/error_codes.hpp"
#include "artistore/result.hpp"
#include "artistore/server/config.hpp"

namespace artistore::server
{

    // Bytes of a whole file the content checks look at.
    inline constexpr std::size_t kContentSampleBytes = 10'000;

    struct ValidationCandidate
    {
        std::string filename;
        std::string content_type;
        std::uint64_t size_bytes{};
        // Set for chunks: the session's declared size and what it already holds.
        std::optional<std::uint64_t> declared_total{};
        std::uint64_t bytes_already_received{};
        std::uint64_t replaced_bytes{};
        // Leading bytes of the candidate; empty for declarations.
        std::span<const std::byte> content{};
        bool is_chunk{false};
    };

    struct CheckOutcome
    {
        bool passed{true};
        bool warning{false};
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        nlohmann::json details{nlohmann::json::object()};

        static CheckOutcome pass(std::string message, nlohmann::json details = nlohmann::json::object());
        static CheckOutcome warn(std::string message, nlohmann::json details = nlohmann::json::object());
        static CheckOutcome fail(ErrorCode code, std::string message,
                                 nlohmann::json details = nlohmann::json::object());
    };

    class ValidationCheck
    {
    public:
        virtual ~ValidationCheck() = default;

        virtual std::string_view name() const noexcept = 0;

        virtual CheckOutcome evaluate(const ValidationCandidate &candidate) const = 0;
    };

    struct CheckResult
    {
        std::string check;
        CheckOutcome outcome;
    };

    struct ValidationReport
    {
        bool passed{true};
        std::optional<std::string> failed_check{};
        ErrorCode code{ErrorCode::Ok};
        std::string reason;
        std::vector<CheckResult> results;
        std::vector<std::string> warnings;

        Status status() const;
    };

    class ValidationPipeline
    {
    public:
        ValidationPipeline() = default;
        ValidationPipeline(ValidationPipeline &&) noexcept = default;
        ValidationPipeline &operator=(ValidationPipeline &&) noexcept = default;

        ValidationPipeline &add(std::unique_ptr<ValidationCheck> check);

        ValidationReport run(const ValidationCandidate &candidate) const;

        std::size_t size() const noexcept { return checks_.size(); }

    private:
        std::vector<std::unique_ptr<ValidationCheck>> checks_;
    };

    // Lowercased content type without parameters, or a guess from the
    // filename extension when none was declared.
    std::string effective_content_type(std::string_view filename, std::string_view declared);

    std::string guess_content_type(std::string_view filename);

    std::string detect_file_type(std::span<const std::byte> content);

    class MimeTypeCheck : public ValidationCheck
    {
    public:
        MimeTypeCheck();
        explicit MimeTypeCheck(std::vector<std::string> allowed);

        std::string_view name() const noexcept override { return "mime_type"; }
        CheckOutcome evaluate(const ValidationCandidate &candidate) const override;

    private:
        std::vector<std::string> allowed_;
    };

    class SizeCheck : public ValidationCheck
    {
    public:
        SizeCheck(std::uint64_t object_cap, std::uint64_t chunk_cap);

        std::string_view name() const noexcept override { return "size"; }
        CheckOutcome evaluate(const ValidationCandidate &candidate) const override;

    private:
        std::uint64_t object_cap_;
        std::uint64_t chunk_cap_;
    };

    class FilenameCheck : public ValidationCheck
    {
    public:
        explicit FilenameCheck(std::size_t max_length);

        std::string_view name() const noexcept override { return "filename"; }
        CheckOutcome evaluate(const ValidationCandidate &candidate) const override;

    private:
        std::size_t max_length_;
    };

    class MetadataCheck : public ValidationCheck
    {
    public:
        std::string_view name() const noexcept override { return "metadata"; }
        CheckOutcome evaluate(const ValidationCandidate &candidate) const override;
    };

    struct ScanVerdict
    {
        bool clean{true};
        std::string reason;
    };

    class MalwareScanner
    {
    public:
        virtual ~MalwareScanner() = default;

        virtual std::string_view engine() const noexcept = 0;

        virtual ScanVerdict scan(std::span<const std::byte> content, std::string_view filename) const = 0;
    };

    // Signature and keyword heuristics over the leading bytes of a file.
    class HeuristicScanner : public MalwareScanner
    {
    public:
        std::string_view engine() const noexcept override { return "heuristic"; }
        ScanVerdict scan(std::span<const std::byte> content, std::string_view filename) const override;
    };

    class MalwareCheck : public ValidationCheck
    {
    public:
        // A null scanner disables scanning; the check then always passes.
        explicit MalwareCheck(std::shared_ptr<const MalwareScanner> scanner);

        std::string_view name() const noexcept override { return "malware"; }
        CheckOutcome evaluate(const ValidationCandidate &candidate) const override;

    private:
        std::shared_ptr<const MalwareScanner> scanner_;
    };

    // Type and size only.
    ValidationPipeline make_chunk_pipeline(const UploadLimits &limits);

    // Checks that need no bytes: type, size and filename.
    ValidationPipeline make_declaration_pipeline(const UploadLimits &limits);

    ValidationPipeline make_file_pipeline(const UploadLimits &limits, std::uint64_t size_cap,
                                          std::shared_ptr<const MalwareScanner> scanner);

} // namespace artistore::server
