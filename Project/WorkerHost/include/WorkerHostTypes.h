#pragma once
#include <cstdint>
#include <string>


namespace WorkerHost
{
	// Process id of a live worker script. 0 is reserved as "no process" / rejection.
	using ProcessId = int32_t;
	static constexpr ProcessId InvalidProcessId = 0;

	// Which execution mode drives a script.
	enum class ScriptFormat : uint8_t
	{
		Legacy = 0, // cooperative stepper, instruction-bounded steps, import inlining
		Native      // call-serializing wrapper, promise-style host calls
	};

	// Terminal state of a process. Running until the completion pipeline settles it.
	enum class ProcessOutcome : uint8_t
	{
		Running = 0,
		Finished,
		Stopped,
		Crashed
	};

	// Scripts named "*.lua" run natively, everything else runs on the stepper.
	inline ScriptFormat FormatFromFilename(const std::string& filename)
	{
		static const std::string nativeSuffix = ".lua";
		if (filename.size() >= nativeSuffix.size() &&
			filename.compare(filename.size() - nativeSuffix.size(), nativeSuffix.size(), nativeSuffix) == 0)
		{
			return ScriptFormat::Native;
		}
		return ScriptFormat::Legacy;
	}

	inline const char* ToString(ProcessOutcome outcome)
	{
		switch (outcome)
		{
		case ProcessOutcome::Running: return "running";
		case ProcessOutcome::Finished: return "finished";
		case ProcessOutcome::Stopped: return "stopped";
		case ProcessOutcome::Crashed: return "crashed";
		}
		return "unknown";
	}
} // namespace WorkerHost
