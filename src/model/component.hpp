/**
 * @file component.hpp
 * @brief Компонент интервала (литология, цвет, размер зерна и т.п.)
 */

#pragma once

#include "value.hpp"
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace striplog::model {

/**
 * @brief Ошибка построения сводки компонента
 */
class ComponentError : public std::runtime_error {
public:
    explicit ComponentError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Набор свойств, описывающих содержимое интервала
 *
 * Порядок свойств сохраняется (он определяет сводку по умолчанию).
 * Строковые значения, являющиеся числами, хранятся как числа;
 * пустые (null) значения отбрасываются.
 */
class Component {
public:
    using Property = std::pair<std::string, Value>;

    Component() = default;
    Component(std::initializer_list<Property> properties);
    explicit Component(std::vector<Property> properties);

    /**
     * @brief Значение свойства или nullptr, если его нет
     */
    [[nodiscard]] const Value* get(std::string_view key) const noexcept;

    [[nodiscard]] bool has(std::string_view key) const noexcept { return get(key) != nullptr; }

    /**
     * @brief Установить (или заменить) свойство
     */
    void set(const std::string& key, Value value);

    void erase(std::string_view key);

    [[nodiscard]] const std::vector<Property>& properties() const noexcept { return properties_; }
    [[nodiscard]] size_t size() const noexcept { return properties_.size(); }
    [[nodiscard]] bool empty() const noexcept { return properties_.empty(); }

    /**
     * @brief Сводное описание компонента
     *
     * Формат использует поля вида {lithology}, с преобразованиями
     * {key!u} (верхний регистр), {key!l}, {key!c} (первая заглавная),
     * {key!t} (каждое слово с заглавной). Отсутствующее поле даёт "_".
     * Без формата перечисляются все непустые свойства через ", ".
     *
     * @param fmt Формат; пустая строка возвращает fallback
     * @param initial Сделать первую букву заглавной (только без формата)
     * @param fallback Значение для пустого компонента
     * @throws ComponentError При незакрытой фигурной скобке в формате
     *
     * Пример: {colour: Red, grainsize: VF-F, lithology: Sandstone}
     * даёт "Red, VF-F, Sandstone".
     */
    [[nodiscard]] std::string summary(const std::optional<std::string>& fmt = std::nullopt,
                                      bool initial = true,
                                      const std::string& fallback = "") const;

    /**
     * @brief Компонент только с указанными свойствами
     */
    [[nodiscard]] Component restrictedTo(const std::vector<std::string>& keys) const;

    /**
     * @brief Равенство по строковым и логическим свойствам
     *
     * Ключи и строки сравниваются без учёта регистра, пустые строки
     * и числовые свойства не участвуют.
     */
    bool operator==(const Component& other) const;

private:
    std::vector<Property> properties_;
};

/// Упорядоченный список компонентов; первый считается основным
using ComponentList = std::vector<Component>;

} // namespace striplog::model
