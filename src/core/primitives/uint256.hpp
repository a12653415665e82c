/**
 * @file uint256.hpp
 * @brief 256-битное беззнаковое целое число
 * 
 * Предоставляет тип для работы с 256-битными числами:
 * сравнение хеша с target, вычисление target из дробной сложности пула.
 */

#pragma once

#include "../types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <compare>

namespace bchpool::core {

/**
 * @brief 256-битное беззнаковое целое число
 * 
 * Хранится в little-endian формате: байтовое представление хеша
 * во внутреннем порядке совпадает с представлением числа.
 */
class uint256 {
public:
    /// @brief Размер в байтах
    static constexpr std::size_t SIZE = 32;
    
    /// @brief Конструктор по умолчанию (нулевое значение)
    constexpr uint256() noexcept : data_{} {}
    
    /// @brief Конструктор из массива байт
    constexpr explicit uint256(const Hash256& hash) noexcept : data_(hash) {}
    
    /// @brief Конструктор из массива байт (rvalue)
    constexpr explicit uint256(Hash256&& hash) noexcept : data_(std::move(hash)) {}
    
    /// @brief Конструктор из 64-битного числа
    constexpr explicit uint256(uint64_t value) noexcept : data_{} {
        data_[0] = static_cast<uint8_t>(value);
        data_[1] = static_cast<uint8_t>(value >> 8);
        data_[2] = static_cast<uint8_t>(value >> 16);
        data_[3] = static_cast<uint8_t>(value >> 24);
        data_[4] = static_cast<uint8_t>(value >> 32);
        data_[5] = static_cast<uint8_t>(value >> 40);
        data_[6] = static_cast<uint8_t>(value >> 48);
        data_[7] = static_cast<uint8_t>(value >> 56);
    }
    
    // =========================================================================
    // Доступ к данным
    // =========================================================================
    
    /**
     * @brief Получить указатель на данные
     */
    [[nodiscard]] constexpr const uint8_t* data() const noexcept {
        return data_.data();
    }
    
    /**
     * @brief Получить изменяемый указатель на данные
     */
    [[nodiscard]] constexpr uint8_t* data() noexcept {
        return data_.data();
    }
    
    /**
     * @brief Получить размер
     */
    [[nodiscard]] static constexpr std::size_t size() noexcept {
        return SIZE;
    }
    
    /**
     * @brief Получить байт по индексу
     */
    [[nodiscard]] constexpr uint8_t operator[](std::size_t i) const noexcept {
        return data_[i];
    }
    
    /**
     * @brief Получить изменяемый байт по индексу
     */
    [[nodiscard]] constexpr uint8_t& operator[](std::size_t i) noexcept {
        return data_[i];
    }
    
    /**
     * @brief Преобразовать в Hash256
     */
    [[nodiscard]] constexpr const Hash256& to_hash256() const noexcept {
        return data_;
    }
    
    /**
     * @brief Проверить, является ли нулём
     */
    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    // =========================================================================
    // Сравнение
    // =========================================================================
    
    /**
     * @brief Оператор сравнения (трёхстороннее)
     * 
     * Сравнивает числа как big-endian (старшие байты сначала).
     */
    [[nodiscard]] constexpr std::strong_ordering operator<=>(
        const uint256& other
    ) const noexcept {
        // Сравниваем с конца (big-endian)
        for (std::size_t i = SIZE; i-- > 0;) {
            if (data_[i] < other.data_[i]) return std::strong_ordering::less;
            if (data_[i] > other.data_[i]) return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }
    
    /**
     * @brief Оператор равенства
     */
    [[nodiscard]] constexpr bool operator==(const uint256& other) const noexcept {
        return data_ == other.data_;
    }
    
    // =========================================================================
    // Арифметика
    // =========================================================================

    /**
     * @brief Сдвиг влево на произвольное число бит (старшие биты теряются)
     */
    [[nodiscard]] uint256 operator<<(unsigned shift) const noexcept;

    /**
     * @brief Сдвиг вправо на произвольное число бит
     */
    [[nodiscard]] uint256 operator>>(unsigned shift) const noexcept;

    /**
     * @brief Целочисленное деление на 64-битный делитель
     *
     * @param divisor Делитель (не ноль)
     * @return Частное; при делении на ноль возвращает max()
     */
    [[nodiscard]] uint256 divide(uint64_t divisor) const noexcept;

    /**
     * @brief Приближённое значение как double
     */
    [[nodiscard]] double to_double() const noexcept;

    // =========================================================================
    // Строковое представление
    // =========================================================================

    /**
     * @brief Преобразовать в hex строку (big-endian, как в explorer)
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Создать из hex строки (big-endian, ровно 64 символа)
     */
    [[nodiscard]] static Result<uint256> from_hex(std::string_view hex);

    // =========================================================================
    // Статические константы
    // =========================================================================
    
    /**
     * @brief Нулевое значение
     */
    [[nodiscard]] static constexpr uint256 zero() noexcept {
        return uint256{};
    }
    
    /**
     * @brief Максимальное значение (все биты = 1)
     */
    [[nodiscard]] static constexpr uint256 max() noexcept {
        uint256 result;
        for (auto& b : result.data_) {
            b = 0xFF;
        }
        return result;
    }
    
    /**
     * @brief Единица (1)
     */
    [[nodiscard]] static constexpr uint256 one() noexcept {
        return uint256{1ULL};
    }
    
private:
    Hash256 data_;
};

} // namespace bchpool::core
