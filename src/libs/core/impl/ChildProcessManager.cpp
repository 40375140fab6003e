/*
 * Copyright (C) 2025 The vconv authors
 *
 * This file is part of vconv.
 *
 * vconv is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vconv is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vconv.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcessManager.hpp"

#include "core/ILogger.hpp"

#include "ChildProcess.hpp"

namespace vconv::core
{
    std::unique_ptr<IChildProcessManager> createChildProcessManager()
    {
        return std::make_unique<ChildProcessManager>();
    }

    std::unique_ptr<IChildProcess> ChildProcessManager::spawnChildProcess(const std::filesystem::path& path, const IChildProcess::Args& args, CapturedStream capturedStream)
    {
        VCONV_LOG(CHILDPROCESS, DEBUG, "Spawning '" << path.string() << "' with " << args.size() << " args");
        return std::make_unique<ChildProcess>(path, args, capturedStream);
    }
} // namespace vconv::core
