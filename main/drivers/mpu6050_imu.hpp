/**
 * @file mpu6050_imu.hpp
 * @brief MPU6050 accelerometer + gyroscope driver returning SI units
 *
 * Accel in m/s^2, gyro in rad/s, die temperature in deg C. One burst
 * read of 14 bytes (ACCEL_XOUT_H .. GYRO_ZOUT_L) per sample keeps the
 * three quantities from the same conversion.
 */

#pragma once

#include "../engine/sensor_types.hpp"

#include <cstdint>
#include "driver/i2c.h"
#include "esp_err.h"

namespace pdi {

/**
 * @brief Accelerometer full-scale range (ACCEL_CONFIG)
 */
enum class AccelRange : uint8_t {
    RANGE_2G  = 0x00,  ///< 16384 LSB/g
    RANGE_4G  = 0x08,  ///< 8192 LSB/g
    RANGE_8G  = 0x10,  ///< 4096 LSB/g
    RANGE_16G = 0x18   ///< 2048 LSB/g
};

/**
 * @brief Gyroscope full-scale range (GYRO_CONFIG)
 */
enum class GyroRange : uint8_t {
    RANGE_250_DPS  = 0x00,  ///< 131 LSB/(deg/s)
    RANGE_500_DPS  = 0x08,  ///< 65.5 LSB/(deg/s)
    RANGE_1000_DPS = 0x10,  ///< 32.8 LSB/(deg/s)
    RANGE_2000_DPS = 0x18   ///< 16.4 LSB/(deg/s)
};

/**
 * @brief Digital low-pass filter setting (CONFIG.DLPF_CFG)
 */
enum class DlpfBandwidth : uint8_t {
    BW_260_HZ = 0,
    BW_184_HZ = 1,
    BW_94_HZ  = 2,
    BW_44_HZ  = 3,
    BW_21_HZ  = 4,
    BW_10_HZ  = 5,
    BW_5_HZ   = 6
};

struct ImuConfig {
    AccelRange accel_range;
    GyroRange gyro_range;
    DlpfBandwidth dlpf;

    /**
     * @brief Handheld vibration survey: +-4 g keeps resolution near 1 g
     */
    static ImuConfig defaultConfig() {
        return ImuConfig{
            .accel_range = AccelRange::RANGE_4G,
            .gyro_range = GyroRange::RANGE_500_DPS,
            .dlpf = DlpfBandwidth::BW_44_HZ
        };
    }
};

struct ImuSample {
    Vec3 accel;     ///< m/s^2
    Vec3 gyro;      ///< rad/s
    float temp_c;
};

/**
 * @class Mpu6050Imu
 * @brief Polled MPU6050 reader on the legacy I2C master driver
 *
 * @code
 * pdi::Mpu6050Imu imu(I2C_NUM_0, GPIO_NUM_21, GPIO_NUM_22);
 * if (imu.init() == ESP_OK) {
 *     pdi::ImuSample s;
 *     imu.readSample(s);
 * }
 * @endcode
 */
class Mpu6050Imu {
public:
    static constexpr uint8_t DEFAULT_ADDR = 0x68;

    Mpu6050Imu(i2c_port_t i2c_port,
               gpio_num_t sda_pin,
               gpio_num_t scl_pin,
               uint8_t device_addr = DEFAULT_ADDR,
               uint32_t i2c_freq_hz = 400000);

    ~Mpu6050Imu();

    // Disable copy (I2C resource management)
    Mpu6050Imu(const Mpu6050Imu&) = delete;
    Mpu6050Imu& operator=(const Mpu6050Imu&) = delete;

    /**
     * @brief Reset, wake and configure ranges
     * @return ESP_ERR_NOT_FOUND if WHO_AM_I does not match
     */
    esp_err_t init(const ImuConfig& config = ImuConfig::defaultConfig());

    esp_err_t readSample(ImuSample& sample);

    esp_err_t readTemperature(float& temp_c);

    /**
     * @brief Full sleep, init() wakes it again
     */
    esp_err_t sleep();

    bool isConnected();

    const ImuConfig& getConfig() const { return config_; }

    /// m/s^2 per LSB for a range
    static float accelScale(AccelRange range);

    /// rad/s per LSB for a range
    static float gyroScale(GyroRange range);

private:
    static constexpr uint8_t WHO_AM_I_EXPECTED = 0x68;

    // Register addresses
    static constexpr uint8_t REG_CONFIG       = 0x1A;
    static constexpr uint8_t REG_GYRO_CONFIG  = 0x1B;
    static constexpr uint8_t REG_ACCEL_CONFIG = 0x1C;
    static constexpr uint8_t REG_ACCEL_XOUT_H = 0x3B;
    static constexpr uint8_t REG_TEMP_OUT_H   = 0x41;
    static constexpr uint8_t REG_PWR_MGMT_1   = 0x6B;
    static constexpr uint8_t REG_WHO_AM_I     = 0x75;

    // PWR_MGMT_1 bits
    static constexpr uint8_t BIT_DEVICE_RESET = 0x80;
    static constexpr uint8_t BIT_SLEEP        = 0x40;
    static constexpr uint8_t BIT_CLKSEL_PLL   = 0x01;

    i2c_port_t i2c_port_;
    gpio_num_t sda_pin_;
    gpio_num_t scl_pin_;
    uint8_t device_addr_;
    uint32_t i2c_freq_hz_;
    bool i2c_initialized_;
    bool sensor_initialized_;
    ImuConfig config_;
    float accel_scale_;
    float gyro_scale_;

    esp_err_t initI2C();
    esp_err_t writeRegister(uint8_t reg, uint8_t value);
    esp_err_t readRegister(uint8_t reg, uint8_t* value);
    esp_err_t readRegisters(uint8_t reg, uint8_t* buffer, size_t length);

    static int16_t be16(const uint8_t* p) {
        return static_cast<int16_t>((p[0] << 8) | p[1]);
    }
};

}  // namespace pdi
