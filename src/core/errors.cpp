#include "linkgl/core/errors.hpp"

namespace linkgl {

namespace {

std::string describeCycle(const std::vector<ResourceRef>& cycle) {
    std::string path;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            path += " -> ";
        }
        path += cycle[i].describe();
    }
    return path;
}

} // anonymous namespace

DuplicateIdError::DuplicateIdError(ResourceRef ref)
    : Error("Duplicate identifier: " + ref.describe() + " is already registered")
    , ref_(std::move(ref)) {
}

UnknownIdError::UnknownIdError(ResourceRef ref)
    : Error("Unknown identifier: " + ref.describe())
    , ref_(std::move(ref)) {
}

UnknownIdError::UnknownIdError(ResourceRef ref, const ResourceRef& requiredBy)
    : Error("Unknown identifier: " + ref.describe() + " (required by " +
            requiredBy.describe() + ")")
    , ref_(std::move(ref)) {
}

CyclicDependencyError::CyclicDependencyError(std::vector<ResourceRef> cycle)
    : Error("Cyclic dependency: " + describeCycle(cycle))
    , cycle_(std::move(cycle)) {
}

MissingRenderCallbackError::MissingRenderCallbackError()
    : Error("Renderer could not be built, because no render callback was supplied") {
}

ContextAcquisitionError::ContextAcquisitionError(const std::string& reason)
    : Error("Could not acquire a graphics context: " + reason) {
}

ShaderCompileError::ShaderCompileError(ShaderId shaderId, ShaderStage stage, std::string log)
    : Error("Could not compile " + std::string(shaderStageName(stage)) + " shader '" +
            shaderId.name() + "': " + (log.empty() ? std::string("unknown error") : log))
    , shaderId_(std::move(shaderId))
    , stage_(stage)
    , log_(std::move(log)) {
}

ProgramLinkError::ProgramLinkError(ProgramId programId, std::string log)
    : Error("Could not link program '" + programId.name() + "': " +
            (log.empty() ? std::string("unknown error") : log))
    , programId_(std::move(programId))
    , log_(std::move(log)) {
}

LocationNotFoundError::LocationNotFoundError(ResourceRef variable, const ResourceRef& where)
    : Error("Location of " + variable.describe() + " not found in " + where.describe())
    , variable_(std::move(variable)) {
}

ResourceCreationError::ResourceCreationError(const ResourceRef& ref)
    : Error("Could not create " + ref.describe() + ": the null handle was returned") {
}

UseAfterFreeError::UseAfterFreeError(const std::string& operation)
    : Error("Renderer used after free(): " + operation) {
}

ReentrancyError::ReentrancyError(const std::string& operation)
    : Error("Reentrant call to " + operation + " from inside a frame") {
}

} // namespace linkgl
