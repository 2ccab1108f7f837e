#pragma once

#include <memory>
#include <string>

#include "Script.h"

namespace ScriptFactory {

    // Script for a Scripts property name (case-insensitive); null when unknown
    std::unique_ptr<Script> create(const std::string& name);

}
