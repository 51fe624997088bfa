#pragma once

#include "linkgl/core/id.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace linkgl {

/**
 * @brief Base class for every error raised by linkgl
 *
 * All structural and validation errors surface synchronously from
 * RendererBuilder::build(). Errors raised by user callbacks during a frame
 * are not wrapped; they propagate unchanged.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Two links (or shader sources) registered with the same identifier
class DuplicateIdError : public Error {
public:
    explicit DuplicateIdError(ResourceRef ref);
    const ResourceRef& ref() const { return ref_; }

private:
    ResourceRef ref_;
};

/// Lookup of an identifier that was never registered or realized
class UnknownIdError : public Error {
public:
    explicit UnknownIdError(ResourceRef ref);
    UnknownIdError(ResourceRef ref, const ResourceRef& requiredBy);
    const ResourceRef& ref() const { return ref_; }

private:
    ResourceRef ref_;
};

/// A link's dependency chain revisits itself
class CyclicDependencyError : public Error {
public:
    explicit CyclicDependencyError(std::vector<ResourceRef> cycle);

    /// The cycle path; the first element is repeated at the end
    const std::vector<ResourceRef>& cycle() const { return cycle_; }

private:
    std::vector<ResourceRef> cycle_;
};

class MissingRenderCallbackError : public Error {
public:
    MissingRenderCallbackError();
};

/// No canvas was supplied, or the canvas did not hand out a context
class ContextAcquisitionError : public Error {
public:
    explicit ContextAcquisitionError(const std::string& reason);
};

class ShaderCompileError : public Error {
public:
    ShaderCompileError(ShaderId shaderId, ShaderStage stage, std::string log);
    const ShaderId& shaderId() const { return shaderId_; }
    ShaderStage stage() const { return stage_; }
    const std::string& log() const { return log_; }

private:
    ShaderId shaderId_;
    ShaderStage stage_;
    std::string log_;
};

class ProgramLinkError : public Error {
public:
    ProgramLinkError(ProgramId programId, std::string log);
    const ProgramId& programId() const { return programId_; }
    const std::string& log() const { return log_; }

private:
    ProgramId programId_;
    std::string log_;
};

/// Attribute or uniform variable not active in the program it is linked to
class LocationNotFoundError : public Error {
public:
    LocationNotFoundError(ResourceRef variable, const ResourceRef& where);
    const ResourceRef& variable() const { return variable_; }

private:
    ResourceRef variable_;
};

/// The graphics API or a create callback returned the null handle
class ResourceCreationError : public Error {
public:
    explicit ResourceCreationError(const ResourceRef& ref);
};

/// Operation on a renderer after free()
class UseAfterFreeError : public Error {
public:
    explicit UseAfterFreeError(const std::string& operation);
};

/// Animation requested without a frame scheduler
class SchedulerError : public Error {
public:
    explicit SchedulerError(const std::string& message) : Error(message) {}
};

/// render() / updateAndRender() invoked from inside a frame callback
class ReentrancyError : public Error {
public:
    explicit ReentrancyError(const std::string& operation);
};

} // namespace linkgl
