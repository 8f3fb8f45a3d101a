#include "artistore/server/validation.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <utility>

#include "artistore/crypto.hpp"

namespace artistore::server
{

    namespace
    {

        const std::vector<std::string> kDefaultAllowedTypes{
            "application/octet-stream",
            "application/zip",
            "application/gzip",
            "application/x-tar",
            "text/plain",
            "application/json",
            "application/x-python",
            "application/x-sh",
            "text/javascript",
            "application/x-hdf",
            "image/png",
            "image/jpeg",
            "text/csv",
        };

        struct ExtensionMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ExtensionMapping, 16> kExtensionTypes{{
            {".zip", "application/zip"},
            {".gz", "application/gzip"},
            {".tgz", "application/gzip"},
            {".tar", "application/x-tar"},
            {".txt", "text/plain"},
            {".md", "text/plain"},
            {".json", "application/json"},
            {".py", "application/x-python"},
            {".h5", "application/x-hdf"},
            {".hdf5", "application/x-hdf"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".csv", "text/csv"},
            {".sh", "application/x-sh"},
            {".js", "text/javascript"},
        }};

        struct Signature
        {
            std::string_view magic;
            std::string_view label;
        };

        // Checked in order; longer signatures sharing a prefix come first.
        constexpr std::array<Signature, 11> kSignatures{{
            {std::string_view("\x89PNG", 4), "PNG image"},
            {std::string_view("\x89HDF\r\n\x1a\n", 8), "HDF5 data"},
            {std::string_view("\xff\xd8\xff", 3), "JPEG image"},
            {std::string_view("PK\x03\x04", 4), "ZIP archive"},
            {std::string_view("\x1f\x8b\x08", 3), "GZIP archive"},
            {std::string_view("%PDF", 4), "PDF document"},
            {std::string_view("\xfd" "7zXZ", 5), "7z archive"},
            {std::string_view("Rar!", 4), "RAR archive"},
            {std::string_view("PK", 2), "Office document"},
            {std::string_view("BM", 2), "BMP image"},
            {std::string_view("\x7f" "ELF", 4), "ELF executable"},
        }};

        constexpr std::array<std::string_view, 4> kExecutableSignatures{{
            std::string_view("MZ\x90\x00", 4),
            std::string_view("\x7f" "ELF", 4),
            std::string_view("#!/bin/bash"),
            std::string_view("#!/bin/sh"),
        }};

        constexpr std::array<std::string_view, 6> kSuspiciousPatterns{{
            "eval(",
            "exec(",
            "system(",
            "subprocess",
            "/bin/bash",
            "cmd.exe",
        }};

        constexpr std::size_t kSignatureWindow = 512;

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

        std::string to_upper(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::toupper(ch)); });
            return result;
        }

        std::string extension_of(std::string_view filename)
        {
            const auto dot = filename.find_last_of('.');
            if (dot == std::string_view::npos || dot == 0)
            {
                return {};
            }
            return to_lower(filename.substr(dot));
        }

        bool has_extension(std::string_view filename, std::initializer_list<std::string_view> extensions)
        {
            const auto extension = extension_of(filename);
            return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
        }

        std::string_view as_text(std::span<const std::byte> content, std::size_t limit)
        {
            const auto length = std::min(content.size(), limit);
            return std::string_view(reinterpret_cast<const char *>(content.data()), length);
        }

        bool is_reserved_device_name(std::string_view filename)
        {
            static const std::array<std::string_view, 22> kReserved{{
                "CON", "PRN", "AUX", "NUL",
                "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
                "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
            }};
            const auto stem = to_upper(filename.substr(0, filename.find('.')));
            return std::find(kReserved.begin(), kReserved.end(), stem) != kReserved.end();
        }

        bool looks_like_text(std::span<const std::byte> content)
        {
            const auto sample = as_text(content, kContentSampleBytes);
            return std::all_of(sample.begin(), sample.end(), [](char ch)
                               {
                const auto byte = static_cast<unsigned char>(ch);
                return byte >= 0x20 || byte == '\n' || byte == '\r' || byte == '\t'; });
        }

    } // namespace

    CheckOutcome CheckOutcome::pass(std::string message, nlohmann::json details)
    {
        return CheckOutcome{.passed = true, .warning = false, .code = ErrorCode::Ok,
                            .message = std::move(message), .details = std::move(details)};
    }

    CheckOutcome CheckOutcome::warn(std::string message, nlohmann::json details)
    {
        return CheckOutcome{.passed = true, .warning = true, .code = ErrorCode::Ok,
                            .message = std::move(message), .details = std::move(details)};
    }

    CheckOutcome CheckOutcome::fail(ErrorCode code, std::string message, nlohmann::json details)
    {
        return CheckOutcome{.passed = false, .warning = false, .code = code,
                            .message = std::move(message), .details = std::move(details)};
    }

    Status ValidationReport::status() const
    {
        if (passed)
        {
            return {};
        }
        return make_error(code, failed_check.value_or("validation") + ": " + reason);
    }

    ValidationPipeline &ValidationPipeline::add(std::unique_ptr<ValidationCheck> check)
    {
        checks_.push_back(std::move(check));
        return *this;
    }

    ValidationReport ValidationPipeline::run(const ValidationCandidate &candidate) const
    {
        ValidationReport report;
        for (const auto &check : checks_)
        {
            auto outcome = check->evaluate(candidate);
            const std::string name(check->name());
            if (outcome.warning)
            {
                report.warnings.push_back(name + ": " + outcome.message);
            }
            const bool passed = outcome.passed;
            if (!passed)
            {
                report.passed = false;
                report.failed_check = name;
                report.code = outcome.code;
                report.reason = outcome.message;
            }
            report.results.push_back(CheckResult{.check = name, .outcome = std::move(outcome)});
            if (!passed)
            {
                break;
            }
        }
        return report;
    }

    std::string guess_content_type(std::string_view filename)
    {
        const auto extension = extension_of(filename);
        for (const auto &mapping : kExtensionTypes)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.content_type);
            }
        }
        return "application/octet-stream";
    }

    std::string effective_content_type(std::string_view filename, std::string_view declared)
    {
        auto type = declared.substr(0, declared.find(';'));
        while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back())))
        {
            type.remove_suffix(1);
        }
        while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front())))
        {
            type.remove_prefix(1);
        }
        if (type.empty())
        {
            return guess_content_type(filename);
        }
        return to_lower(type);
    }

    std::string detect_file_type(std::span<const std::byte> content)
    {
        const auto head = as_text(content, 16);
        for (const auto &signature : kSignatures)
        {
            if (head.starts_with(signature.magic))
            {
                return std::string(signature.label);
            }
        }
        if (head.size() >= 2 && static_cast<unsigned char>(head[0]) == 0x80 &&
            static_cast<unsigned char>(head[1]) >= 2 && static_cast<unsigned char>(head[1]) <= 5)
        {
            return "Pickle data";
        }
        if (head.size() >= 9 && head[8] == '{')
        {
            // safetensors: little-endian header length, then a JSON header.
            std::uint64_t header_length = 0;
            for (int i = 7; i >= 0; --i)
            {
                header_length = (header_length << 8) | static_cast<unsigned char>(head[static_cast<std::size_t>(i)]);
            }
            if (header_length > 0 && header_length < 100'000'000)
            {
                return "Safetensors data";
            }
        }
        if (!content.empty() && looks_like_text(content))
        {
            return "Text";
        }
        return "Unknown/Binary";
    }

    MimeTypeCheck::MimeTypeCheck() : allowed_(kDefaultAllowedTypes) {}

    MimeTypeCheck::MimeTypeCheck(std::vector<std::string> allowed) : allowed_(std::move(allowed)) {}

    CheckOutcome MimeTypeCheck::evaluate(const ValidationCandidate &candidate) const
    {
        const auto guessed = guess_content_type(candidate.filename);
        const auto actual = effective_content_type(candidate.filename, candidate.content_type);
        nlohmann::json details = {
            {"guessed_type", guessed},
            {"provided_type", candidate.content_type},
            {"actual_type", actual},
        };
        if (std::find(allowed_.begin(), allowed_.end(), actual) == allowed_.end())
        {
            return CheckOutcome::fail(ErrorCode::ValidationFailed, "MIME type " + actual + " not in allowed list",
                                      std::move(details));
        }
        return CheckOutcome::pass("MIME type " + actual + " is acceptable", std::move(details));
    }

    SizeCheck::SizeCheck(std::uint64_t object_cap, std::uint64_t chunk_cap)
        : object_cap_(object_cap), chunk_cap_(chunk_cap)
    {
    }

    CheckOutcome SizeCheck::evaluate(const ValidationCandidate &candidate) const
    {
        nlohmann::json details = {
            {"size_bytes", candidate.size_bytes},
            {"limit_bytes", object_cap_},
        };
        if (!candidate.is_chunk)
        {
            if (candidate.size_bytes > object_cap_)
            {
                return CheckOutcome::fail(ErrorCode::PayloadTooLarge,
                                          "File size " + std::to_string(candidate.size_bytes) +
                                              " bytes exceeds limit of " + std::to_string(object_cap_) + " bytes",
                                          std::move(details));
            }
            return CheckOutcome::pass("File size is within limit", std::move(details));
        }

        if (candidate.size_bytes > chunk_cap_)
        {
            return CheckOutcome::fail(ErrorCode::PayloadTooLarge,
                                      "Chunk of " + std::to_string(candidate.size_bytes) +
                                          " bytes exceeds chunk limit of " + std::to_string(chunk_cap_) + " bytes",
                                      std::move(details));
        }
        const auto base = candidate.bytes_already_received >= candidate.replaced_bytes
                              ? candidate.bytes_already_received - candidate.replaced_bytes
                              : 0;
        const auto projected = base + candidate.size_bytes;
        details["projected_bytes"] = projected;
        if (projected > object_cap_)
        {
            return CheckOutcome::fail(ErrorCode::PayloadTooLarge,
                                      "Upload would exceed object limit of " + std::to_string(object_cap_) + " bytes",
                                      std::move(details));
        }
        if (candidate.declared_total && projected > *candidate.declared_total)
        {
            return CheckOutcome::fail(ErrorCode::SizeMismatch,
                                      "Chunk would exceed declared size of " +
                                          std::to_string(*candidate.declared_total) + " bytes",
                                      std::move(details));
        }
        return CheckOutcome::pass("Chunk size is within limit", std::move(details));
    }

    FilenameCheck::FilenameCheck(std::size_t max_length) : max_length_(max_length) {}

    CheckOutcome FilenameCheck::evaluate(const ValidationCandidate &candidate) const
    {
        const auto &filename = candidate.filename;
        std::vector<std::string> issues;
        if (filename.empty())
        {
            issues.emplace_back("Filename is empty");
        }
        if (filename.find("..") != std::string::npos || filename.find('/') != std::string::npos ||
            filename.find('\\') != std::string::npos)
        {
            issues.emplace_back("Filename contains path traversal");
        }
        if (filename.find('\0') != std::string::npos)
        {
            issues.emplace_back("Filename contains null bytes");
        }
        if (filename.size() > max_length_)
        {
            issues.emplace_back("Filename exceeds " + std::to_string(max_length_) + " characters");
        }
        if (std::any_of(filename.begin(), filename.end(), [](char ch)
                        {
            const auto byte = static_cast<unsigned char>(ch);
            return byte != 0 && (byte < 0x20 || byte == 0x7f); }))
        {
            issues.emplace_back("Filename contains non-printable characters");
        }
        if (!filename.empty() && is_reserved_device_name(filename))
        {
            issues.emplace_back("Filename is a reserved device name");
        }

        nlohmann::json details = {
            {"length", filename.size()},
            {"issues", issues},
        };
        if (issues.empty())
        {
            return CheckOutcome::pass("Filename is valid", std::move(details));
        }
        std::string message = "Filename issues: ";
        for (std::size_t i = 0; i < issues.size(); ++i)
        {
            message += (i == 0 ? "" : ", ") + issues[i];
        }
        return CheckOutcome::fail(ErrorCode::ValidationFailed, std::move(message), std::move(details));
    }

    CheckOutcome MetadataCheck::evaluate(const ValidationCandidate &candidate) const
    {
        const auto head = candidate.content.first(std::min<std::size_t>(candidate.content.size(), 4));
        nlohmann::json details = {
            {"size_bytes", candidate.size_bytes},
            {"extension", extension_of(candidate.filename)},
            {"magic_bytes", head.size() == 4 ? crypto::to_hex(std::span<const unsigned char>(
                                                   reinterpret_cast<const unsigned char *>(head.data()), head.size()))
                                             : std::string{}},
        };
        const auto detected = detect_file_type(candidate.content);
        details["detected_type"] = detected;
        if (detected == "Unknown/Binary")
        {
            return CheckOutcome::warn("No recognizable format header", std::move(details));
        }
        return CheckOutcome::pass("Metadata extracted successfully", std::move(details));
    }

    ScanVerdict HeuristicScanner::scan(std::span<const std::byte> content, std::string_view filename) const
    {
        const auto head = as_text(content, kSignatureWindow);
        if (!has_extension(filename, {".sh", ".exe", ".dll", ".so"}))
        {
            for (const auto signature : kExecutableSignatures)
            {
                if (head.find(signature) != std::string_view::npos)
                {
                    return ScanVerdict{.clean = false, .reason = "executable signature in file header"};
                }
            }
        }

        if (!has_extension(filename, {".py", ".sh", ".js"}))
        {
            const auto text = as_text(content, kContentSampleBytes);
            for (const auto pattern : kSuspiciousPatterns)
            {
                if (text.find(pattern) != std::string_view::npos)
                {
                    return ScanVerdict{.clean = false, .reason = "suspicious pattern '" + std::string(pattern) + "'"};
                }
            }
        }
        return ScanVerdict{};
    }

    MalwareCheck::MalwareCheck(std::shared_ptr<const MalwareScanner> scanner) : scanner_(std::move(scanner)) {}

    CheckOutcome MalwareCheck::evaluate(const ValidationCandidate &candidate) const
    {
        if (!scanner_)
        {
            return CheckOutcome::pass("Malware scan disabled", {{"scan_enabled", false}});
        }
        nlohmann::json details = {
            {"scan_enabled", true},
            {"engine", scanner_->engine()},
        };
        const auto verdict = scanner_->scan(candidate.content, candidate.filename);
        if (!verdict.clean)
        {
            details["reason"] = verdict.reason;
            return CheckOutcome::fail(ErrorCode::ValidationFailed, "File flagged by malware scan: " + verdict.reason,
                                      std::move(details));
        }
        return CheckOutcome::pass("File passed malware scan", std::move(details));
    }

    ValidationPipeline make_chunk_pipeline(const UploadLimits &limits)
    {
        ValidationPipeline pipeline;
        pipeline.add(std::make_unique<MimeTypeCheck>())
            .add(std::make_unique<SizeCheck>(limits.max_object_size, limits.max_chunk_size));
        return pipeline;
    }

    ValidationPipeline make_declaration_pipeline(const UploadLimits &limits)
    {
        ValidationPipeline pipeline;
        pipeline.add(std::make_unique<MimeTypeCheck>())
            .add(std::make_unique<SizeCheck>(limits.max_object_size, limits.max_chunk_size))
            .add(std::make_unique<FilenameCheck>(limits.max_filename_length));
        return pipeline;
    }

    ValidationPipeline make_file_pipeline(const UploadLimits &limits, std::uint64_t size_cap,
                                          std::shared_ptr<const MalwareScanner> scanner)
    {
        ValidationPipeline pipeline;
        pipeline.add(std::make_unique<MimeTypeCheck>())
            .add(std::make_unique<SizeCheck>(size_cap, limits.max_chunk_size))
            .add(std::make_unique<FilenameCheck>(limits.max_filename_length))
            .add(std::make_unique<MetadataCheck>())
            .add(std::make_unique<MalwareCheck>(std::move(scanner)));
        return pipeline;
    }

} // namespace artistore::server
