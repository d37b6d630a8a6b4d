/**
 * @file striplog.hpp
 * @brief Колонка: упорядоченная последовательность интервалов
 *
 * Колонка хранит интервалы в стратиграфическом порядке (сверху вниз)
 * и поддерживает этот порядок при любом изменении. Все изменяющие
 * операции сначала строят новый список и подменяют им текущий только
 * при успехе.
 */

#pragma once

#include "model/interval.hpp"
#include "model/settings.hpp"
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace striplog::core {

using namespace striplog::model;

/**
 * @brief Ошибка построения или изменения колонки
 */
class StriplogError : public std::runtime_error {
public:
    explicit StriplogError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Строка сводной таблицы: основной компонент и его суммарная мощность
 */
struct UniqueEntry {
    std::optional<Component> component;  ///< nullopt для интервалов без компонентов
    double thickness = 0.0;
};

/**
 * @brief Функция свёртки отсчётов каротажа в одно значение интервала
 */
using Reducer = std::function<double(const std::vector<double>&)>;

/**
 * @brief Колонка интервалов
 */
class Striplog {
public:
    using const_iterator = std::vector<Interval>::const_iterator;

    /**
     * @brief Построение колонки
     *
     * @param intervals Интервалы в любом порядке
     * @param order Порядок; nullopt определяет его по данным
     * @param source Источник данных (произвольная строка)
     * @throws StriplogError Пустой список; порядок не определяется;
     *         данные противоречат заданному порядку
     */
    explicit Striplog(std::vector<Interval> intervals,
                      std::optional<Order> order = std::nullopt,
                      std::string source = {});

    // === Доступ ===

    [[nodiscard]] size_t size() const noexcept { return intervals_.size(); }
    [[nodiscard]] const Interval& operator[](size_t index) const { return intervals_[index]; }

    /**
     * @throws StriplogError Индекс вне диапазона
     */
    [[nodiscard]] const Interval& at(size_t index) const;

    [[nodiscard]] const_iterator begin() const noexcept { return intervals_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return intervals_.end(); }
    [[nodiscard]] const std::vector<Interval>& intervals() const noexcept { return intervals_; }

    [[nodiscard]] Order order() const noexcept { return order_; }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    void setSource(std::string source) { source_ = std::move(source); }

    /**
     * @brief Подвыборка [begin, end); nullopt, если она пуста
     */
    [[nodiscard]] std::optional<Striplog> slice(size_t begin, size_t end) const;

    /**
     * @brief Подвыборка по индексам; nullopt, если она пуста
     * @throws StriplogError Индекс вне диапазона
     */
    [[nodiscard]] std::optional<Striplog> select(const std::vector<size_t>& indices) const;

    // === Изменение ===

    /**
     * @brief Заменить интервал по индексу
     */
    void replace(size_t index, Interval interval);

    /**
     * @brief Заменить несколько интервалов сразу
     * @throws StriplogError Число индексов и интервалов не совпадает
     */
    void assign(const std::vector<size_t>& indices, std::vector<Interval> intervals);

    /**
     * @brief Удалить интервалы по индексам
     * @throws StriplogError Индекс вне диапазона или колонка стала бы пустой
     */
    void erase(const std::vector<size_t>& indices);

    void append(Interval interval);
    void insert(size_t index, Interval interval);
    void extend(const Striplog& other);

    /**
     * @brief Извлечь интервал (по умолчанию последний)
     * @throws StriplogError Колонка стала бы пустой
     */
    Interval pop(std::optional<size_t> index = std::nullopt);

    /**
     * @brief Склейка колонок, порядок определяется заново
     */
    [[nodiscard]] Striplog operator+(const Striplog& other) const;
    [[nodiscard]] Striplog operator+(const Interval& interval) const;

    // === Сводки ===

    /**
     * @brief Есть ли компонент хотя бы в одном интервале
     */
    [[nodiscard]] bool contains(const Component& component) const;

    /**
     * @brief Ближайшая к началу отсчёта позиция
     *
     * Для глубин: наименьшая кровля; иначе: наименьшая подошва.
     */
    [[nodiscard]] Position start() const;

    /**
     * @brief Наиболее удалённая от начала отсчёта позиция
     */
    [[nodiscard]] Position stop() const;

    /**
     * @brief Суммарная мощность интервалов
     */
    [[nodiscard]] double cum() const noexcept;
    [[nodiscard]] double mean() const noexcept { return cum() / static_cast<double>(size()); }

    /**
     * @brief Основные компоненты с суммарной мощностью, по убыванию мощности
     */
    [[nodiscard]] std::vector<UniqueEntry> unique() const;

    /**
     * @brief Различные основные компоненты (без пустых)
     */
    [[nodiscard]] ComponentList components() const;

    [[nodiscard]] std::vector<size_t> thickestIndices(size_t n = 1) const;
    [[nodiscard]] std::vector<size_t> thinnestIndices(size_t n = 1) const;
    [[nodiscard]] Striplog thickest(size_t n = 1) const;
    [[nodiscard]] Striplog thinnest(size_t n = 1) const;

    /**
     * @brief Первый интервал, содержащий уровень d
     */
    [[nodiscard]] std::optional<Interval> readAt(double d) const;
    [[nodiscard]] std::optional<size_t> indexAt(double d) const;

    /**
     * @brief Поиск по регулярному выражению в описаниях
     *
     * Для интервалов без описания используется сводка основного компонента.
     *
     * @throws StriplogError Некорректное регулярное выражение
     */
    [[nodiscard]] std::optional<Striplog> find(const std::string& pattern, bool ignore_case = true) const;
    [[nodiscard]] std::optional<Striplog> find(const Component& component) const;
    [[nodiscard]] std::vector<size_t> findIndices(const std::string& pattern, bool ignore_case = true) const;
    [[nodiscard]] std::vector<size_t> findIndices(const Component& component) const;

    /**
     * @brief Значения поля данных по интервалам
     *
     * Нечисловые и отсутствующие значения заменяются на fallback.
     */
    [[nodiscard]] std::vector<double> getData(const std::string& field,
                                              double fallback = std::numeric_limits<double>::quiet_NaN()) const;

    /**
     * @brief Перенести каротаж в данные интервалов
     *
     * Отсчёты группируются по интервалам (readAt), свёртка каждой
     * группы записывается в поле name.
     *
     * @param reducer Свёртка; по умолчанию среднее
     * @throws StriplogError Размеры log и basis не совпадают
     */
    [[nodiscard]] Striplog extract(const std::vector<double>& log,
                                   const std::vector<double>& basis,
                                   const std::string& name,
                                   Reducer reducer = nullptr) const;

    // === Разрывы и перекрытия ===

    /**
     * @brief Разрывы между соседними интервалами как пустые интервалы
     * @return nullopt, если разрывов нет
     */
    [[nodiscard]] std::optional<Striplog> findGaps() const;

    /**
     * @brief Перекрытия соседних интервалов как пустые интервалы
     * @return nullopt, если перекрытий нет
     */
    [[nodiscard]] std::optional<Striplog> findOverlaps() const;

    /**
     * @brief Индексы интервалов, после которых есть разрыв
     */
    [[nodiscard]] std::vector<size_t> gapIndices() const;

    /**
     * @brief Индексы интервалов, перекрывающихся со следующим
     */
    [[nodiscard]] std::vector<size_t> overlapIndices() const;

    /**
     * @brief Устранить перекрытия слиянием пар интервалов (на месте)
     *
     * @throws StriplogError Слияние не сходится
     */
    void mergeOverlaps();

    /**
     * @brief Закрыть разрывы, продлевая соседей (на месте)
     *
     * Метаданные перемещённых границ теряются.
     */
    void anneal(AnnealMode mode = AnnealMode::Middle);

    /**
     * @brief Удалить тонкие интервалы (на месте)
     *
     * @throws StriplogError Не задан или задано несколько критериев;
     *         удалены были бы все интервалы
     */
    void prune(const PruneCriteria& criteria);

    /**
     * @brief Объединить соприкасающихся соседей с одинаковыми компонентами
     *
     * @param strict true: сравниваются списки компонентов целиком,
     *               false: только основные компоненты
     */
    [[nodiscard]] Striplog mergeNeighbours(bool strict = true) const;

    // === Операции над колонками ===

    /**
     * @brief Каждый интервал объединяется со всеми перекрывающими его из other
     */
    [[nodiscard]] Striplog unionWith(const Striplog& other) const;

    /**
     * @brief Все попарные пересечения; nullopt, если их нет
     */
    [[nodiscard]] std::optional<Striplog> intersect(const Striplog& other) const;

    /**
     * @brief Заполнить разрывы интервалами с указанным компонентом
     */
    [[nodiscard]] Striplog fill(const std::optional<Component>& component = std::nullopt) const;

    /**
     * @brief Перевернуть колонку (глубины <-> отметки) на месте
     */
    void invert();
    [[nodiscard]] Striplog inverted() const;

    /**
     * @brief Обрезать колонку по новому диапазону (на месте)
     *
     * Отсутствующая граница берётся из текущей колонки. Границы
     * должны лежать внутри колонки.
     *
     * @throws StriplogError Граница вне колонки
     */
    void crop(std::optional<double> start, std::optional<double> stop);
    [[nodiscard]] Striplog cropped(std::optional<double> start, std::optional<double> stop) const;

    /**
     * @brief Копия, сдвинутая на delta либо к новому началу start
     *
     * @throws StriplogError Не задано ни delta, ни start
     */
    [[nodiscard]] Striplog shifted(std::optional<double> delta,
                                   std::optional<double> start = std::nullopt) const;

    /**
     * @brief Доля мощности интервалов, у которых логический атрибут
     *        основного компонента истинен
     *
     * @throws StriplogError Суммарная мощность равна нулю
     */
    [[nodiscard]] double netToGross(const std::string& attr) const;

    /**
     * @brief Все основные компоненты имеют логическое значение attr
     *
     * Пустой attr означает первое свойство основного компонента.
     */
    [[nodiscard]] bool isBinary(const std::string& attr = {}) const;

private:
    /**
     * @brief Проверить соответствие порядку и отсортировать
     */
    [[nodiscard]] static std::vector<Interval> normalized(std::vector<Interval> intervals, Order order);
    [[nodiscard]] static Order detectOrder(const std::vector<Interval>& intervals);

    void commit(std::vector<Interval> intervals);

    [[nodiscard]] std::vector<size_t> incongruities(bool overlaps) const;
    [[nodiscard]] std::optional<Striplog> incongruityIntervals(bool overlaps) const;

    std::vector<Interval> intervals_;
    Order order_ = Order::Depth;
    std::string source_;
};

} // namespace striplog::core
