#include "strata/domain/domain_events.hpp"

namespace strata::domain {
namespace {

struct NameVisitor {
    const char* operator()(const FileCreated&) const { return "FileCreated"; }
    const char* operator()(const FileUploadStarted&) const { return "FileUploadStarted"; }
    const char* operator()(const FileUploadCompleted&) const { return "FileUploadCompleted"; }
    const char* operator()(const FileArchived&) const { return "FileArchived"; }
    const char* operator()(const FileUploadFailed&) const { return "FileUploadFailed"; }
};

} // namespace

const char* event_name(const DomainEvent& event) {
    return std::visit(NameVisitor{}, event);
}

} // namespace strata::domain
