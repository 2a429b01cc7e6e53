#pragma once

#include <shared_data/file_entry.hpp>

namespace SecureShell
{
    using FileInformation = SharedData::FileEntry;
}
