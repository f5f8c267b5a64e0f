#pragma once
// WorldSerializer.h
//
// JSON (de)serialization of the persisted world: servers, the scripts stored on them and the
// running-script records to rehydrate.
//
// {
//   "servers": [
//     { "hostname": "home", "maxRam": 32, "hasAdminRights": true,
//       "scripts": [ { "filename": "a.script", "code": "...", "ramUsage": 1.6 },
//                    { "filename": "b.lua", "path": "scripts/b.lua", "ramUsage": 2 } ],
//       "runningScripts": [ { "filename": "a.script", "args": [1, "x"], "threads": 2,
//                             "onlineRunningTime": 0, ..., "logs": [] } ] }
//   ]
// }
//
// "path" is resolved relative to the world file. A running-script record takes its per-thread
// RAM cost from the stored script, so edits to a script are charged on the next load.
// Load functions return false on I/O or parse errors and leave 'out' untouched in that case.

#include <string>
#include <vector>

#include "Server.h"

namespace WorkerHost {

    class WorldSerializer {
    public:
        static bool LoadFromFile(const std::string& filePath, std::vector<ServerPtr>& out);
        static bool LoadFromString(const std::string& json, std::vector<ServerPtr>& out,
                                   const std::string& baseDirectory = "");

        static std::string SaveToString(const std::vector<ServerPtr>& servers);
        static bool SaveToFile(const std::string& filePath, const std::vector<ServerPtr>& servers);
    };

} // namespace WorkerHost
