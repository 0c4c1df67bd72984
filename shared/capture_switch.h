// capture_switch.h - Normal/capture pair of per-mode objects

#ifndef TESSERA_CAPTURE_SWITCH_H
#define TESSERA_CAPTURE_SWITCH_H

#include <functional>
#include <memory>
#include <utility>

namespace tessera {

/**
 * Holds the object used for the current frame mode plus a standby object
 * for the other mode. The standby is created on the first switch and then
 * kept, so toggling back and forth never reallocates.
 */
template <typename T>
class CaptureSwitch {
public:
    using Factory = std::function<std::unique_ptr<T>(bool capture)>;

    CaptureSwitch(std::unique_ptr<T> normal, Factory factory)
        : active_(std::move(normal)), factory_(std::move(factory)) {}

    /**
     * Make the object for the requested mode active.
     * @return false if the standby object could not be created; the mode is unchanged
     */
    bool select(bool capture) {
        if (capture == capture_) {
            return true;
        }
        if (!standby_) {
            standby_ = factory_ ? factory_(capture) : nullptr;
            if (!standby_) {
                return false;
            }
        }
        std::swap(active_, standby_);
        capture_ = capture;
        return true;
    }

    T& active() { return *active_; }
    const T& active() const { return *active_; }
    T* standby() { return standby_.get(); }

    bool capture() const { return capture_; }
    bool hasStandby() const { return standby_ != nullptr; }

private:
    std::unique_ptr<T> active_;
    std::unique_ptr<T> standby_;
    Factory factory_;
    bool capture_ = false;
};

}  // namespace tessera

#endif  // TESSERA_CAPTURE_SWITCH_H
