#ifndef FAULTLINE_REPORT_HPP
#define FAULTLINE_REPORT_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <faultline/core.hpp>
#include <faultline/faultline_export.h>

namespace faultline {

#if FAULTLINE_API_VERSION == 1
inline
#endif
    namespace v1 {

// section -> key -> value. Opaque to faultline; filled by platform collaborators.
using Metadata = std::map<std::string, std::map<std::string, std::string>>;

/**
 * @brief One reportable event: the flattened exceptions, the handled state shared by all of
 * them, and the metadata merged in before delivery. Owns its records exclusively.
 */
class FAULTLINE_EXPORT Report {
   public:
    Report(std::vector<ExceptionRecord> exceptions, HandledState handledState)
        : exceptions_{std::move(exceptions)}, handledState_{handledState} {}

    [[nodiscard]] const std::vector<ExceptionRecord>& exceptions() const noexcept {
        return exceptions_;
    }
    // Post-hoc enrichment of error classes and messages before delivery
    [[nodiscard]] std::vector<ExceptionRecord>& exceptions() noexcept {
        return exceptions_;
    }
    [[nodiscard]] const HandledState& handledState() const noexcept {
        return handledState_;
    }
    [[nodiscard]] const Metadata& metadata() const noexcept {
        return metadata_;
    }
    [[nodiscard]] const std::string& context() const noexcept {
        return context_;
    }

    void setContext(std::string context) {
        context_ = std::move(context);
    }

    void addMetadata(const std::string& section, const std::string& key, std::string value) {
        metadata_[section][key] = std::move(value);
    }

    // Existing keys are overwritten by the merged values
    void mergeMetadata(const Metadata& metadata) {
        for (const auto& [section, values] : metadata) {
            for (const auto& [key, value] : values) {
                metadata_[section][key] = value;
            }
        }
    }

   private:
    std::vector<ExceptionRecord> exceptions_;
    HandledState handledState_;
    Metadata metadata_;
    std::string context_;
};

}  // namespace v1

}  // namespace faultline

#endif  // FAULTLINE_REPORT_HPP
