//
// Created by Revhome on 15.10.2026.
//

#ifndef URL_SUCKER_APP_TOOL_ACTIONS_HPP
#define URL_SUCKER_APP_TOOL_ACTIONS_HPP

#include <string>

// 📤 GET-запрос, готовый к передаче во внешний инструмент
struct OutboundRequest {
    std::string url;     // Полный URL
    std::string host;    // Хост сервиса
    int port = 80;
    bool secure = false;
    std::string raw;     // Текст HTTP/1.1 запроса
};

// Действия, которые предоставляет хост перехвата. Реализации могут бросать исключения,
// ActionDispatcher их перехватывает.
class ToolActions {
public:
    virtual ~ToolActions() = default;

    // Открыть запрос в рабочей области повторной отправки под меткой label
    virtual void sendToRepeater(const OutboundRequest &request, const std::string &label) = 0;

    // Передать запрос в инструмент для заметок и группировки
    virtual void sendToOrganizer(const OutboundRequest &request) = 0;
};

#endif //URL_SUCKER_APP_TOOL_ACTIONS_HPP
