#pragma once

#include <string>
#include <vector>

namespace utils {

/**
 * @brief Native platform message boxes
 *
 * The application has no window of its own while starting up or updating, so
 * every prompt goes through the platform dialog: MessageBoxW on Windows,
 * zenity/notify-send on Linux with a console fallback.
 */
class NativeMessageBox
{
public:
    enum class Type
    {
        Error,
        Warning,
        Info
    };

    /**
     * @brief Show a native message box and wait for it to be closed
     * @param title Message box title
     * @param message Message content
     * @param type Message type (error, warning, info)
     */
    static void Show(const std::string& title, const std::string& message, Type type = Type::Info);

    /**
     * @brief Ask a yes/no question
     * @return true when the user accepted
     */
    static bool Confirm(const std::string& title, const std::string& message, Type type = Type::Info);

    /**
     * @brief Offer up to two actions plus dismissal
     * @param options Button labels, first is the default action
     * @return Index of the chosen option, -1 when dismissed
     */
    static int Choose(const std::string& title, const std::string& message, const std::vector<std::string>& options,
                      Type type = Type::Warning);

    /**
     * @brief Non-blocking desktop notification where the platform has one
     */
    static void Notify(const std::string& title, const std::string& message);
};

} // namespace utils
