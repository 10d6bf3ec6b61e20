#pragma once

#include <string>

struct AgentError {
    enum class Kind {
        NotFoundSpecifier,
        NotFoundIdentity,
        NotFoundDefault,
        ExclusivityViolated,
        StartFailure,
        IdentityAddFailure,
        ConfigurationError,
    };

    Kind kind;
    std::string message;
};
