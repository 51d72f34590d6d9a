#include "sink.hh"
#include "macros.hh"

bool
xzarrguard::finalize_sink(std::unique_ptr<Sink>&& sink)
{
    if (sink == nullptr) {
        LOG_DEBUG("Sink is null. Nothing to finalize.");
        return true;
    }

    if (!sink->flush_()) {
        return false;
    }

    sink.reset();
    return true;
}

bool
xzarrguard::write_string(Sink& sink, std::string_view text)
{
    return sink.write(
      0,
      std::span<const std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                 text.size()));
}
