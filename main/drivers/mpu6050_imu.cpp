/**
 * @file mpu6050_imu.cpp
 * @brief MPU6050 register access and unit conversion
 */

// FreeRTOS must be included first
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "mpu6050_imu.hpp"
#include "esp_log.h"

static const char* TAG = "MPU6050";

namespace pdi {

namespace {

constexpr float DEG_TO_RAD = 0.01745329252f;

}  // namespace

Mpu6050Imu::Mpu6050Imu(i2c_port_t i2c_port,
                       gpio_num_t sda_pin,
                       gpio_num_t scl_pin,
                       uint8_t device_addr,
                       uint32_t i2c_freq_hz)
    : i2c_port_(i2c_port)
    , sda_pin_(sda_pin)
    , scl_pin_(scl_pin)
    , device_addr_(device_addr)
    , i2c_freq_hz_(i2c_freq_hz)
    , i2c_initialized_(false)
    , sensor_initialized_(false)
    , config_(ImuConfig::defaultConfig())
    , accel_scale_(accelScale(config_.accel_range))
    , gyro_scale_(gyroScale(config_.gyro_range))
{
}

Mpu6050Imu::~Mpu6050Imu() {
    if (i2c_initialized_) {
        i2c_driver_delete(i2c_port_);
    }
}

float Mpu6050Imu::accelScale(AccelRange range) {
    float lsb_per_g;
    switch (range) {
        case AccelRange::RANGE_2G:  lsb_per_g = 16384.0f; break;
        case AccelRange::RANGE_4G:  lsb_per_g = 8192.0f;  break;
        case AccelRange::RANGE_8G:  lsb_per_g = 4096.0f;  break;
        case AccelRange::RANGE_16G: lsb_per_g = 2048.0f;  break;
        default:                    lsb_per_g = 8192.0f;
    }
    return STANDARD_GRAVITY / lsb_per_g;
}

float Mpu6050Imu::gyroScale(GyroRange range) {
    float lsb_per_dps;
    switch (range) {
        case GyroRange::RANGE_250_DPS:  lsb_per_dps = 131.0f; break;
        case GyroRange::RANGE_500_DPS:  lsb_per_dps = 65.5f;  break;
        case GyroRange::RANGE_1000_DPS: lsb_per_dps = 32.8f;  break;
        case GyroRange::RANGE_2000_DPS: lsb_per_dps = 16.4f;  break;
        default:                        lsb_per_dps = 65.5f;
    }
    return DEG_TO_RAD / lsb_per_dps;
}

esp_err_t Mpu6050Imu::init(const ImuConfig& config) {
    esp_err_t ret;

    if (!i2c_initialized_) {
        ret = initI2C();
        if (ret != ESP_OK) {
            return ret;
        }
    }

    if (!isConnected()) {
        ESP_LOGE(TAG, "MPU6050 not detected at 0x%02X", device_addr_);
        return ESP_ERR_NOT_FOUND;
    }

    ret = writeRegister(REG_PWR_MGMT_1, BIT_DEVICE_RESET);
    if (ret != ESP_OK) return ret;
    vTaskDelay(pdMS_TO_TICKS(100));

    ret = writeRegister(REG_PWR_MGMT_1, BIT_CLKSEL_PLL);
    if (ret != ESP_OK) return ret;
    vTaskDelay(pdMS_TO_TICKS(10));

    ret = writeRegister(REG_CONFIG, static_cast<uint8_t>(config.dlpf));
    if (ret != ESP_OK) return ret;

    ret = writeRegister(REG_ACCEL_CONFIG, static_cast<uint8_t>(config.accel_range));
    if (ret != ESP_OK) return ret;

    ret = writeRegister(REG_GYRO_CONFIG, static_cast<uint8_t>(config.gyro_range));
    if (ret != ESP_OK) return ret;

    config_ = config;
    accel_scale_ = accelScale(config.accel_range);
    gyro_scale_ = gyroScale(config.gyro_range);
    sensor_initialized_ = true;

    ESP_LOGI(TAG, "MPU6050 ready: accel 0x%02X, gyro 0x%02X, DLPF %d",
             static_cast<uint8_t>(config.accel_range), static_cast<uint8_t>(config.gyro_range),
             static_cast<int>(config.dlpf));
    return ESP_OK;
}

esp_err_t Mpu6050Imu::readSample(ImuSample& sample) {
    if (!sensor_initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    // ACCEL(6) TEMP(2) GYRO(6), big-endian
    uint8_t buffer[14];
    esp_err_t ret = readRegisters(REG_ACCEL_XOUT_H, buffer, sizeof(buffer));
    if (ret != ESP_OK) {
        return ret;
    }

    sample.accel = Vec3{be16(&buffer[0]) * accel_scale_,
                        be16(&buffer[2]) * accel_scale_,
                        be16(&buffer[4]) * accel_scale_};
    sample.temp_c = be16(&buffer[6]) / 340.0f + 36.53f;
    sample.gyro = Vec3{be16(&buffer[8]) * gyro_scale_,
                       be16(&buffer[10]) * gyro_scale_,
                       be16(&buffer[12]) * gyro_scale_};
    return ESP_OK;
}

esp_err_t Mpu6050Imu::readTemperature(float& temp_c) {
    uint8_t buffer[2];
    esp_err_t ret = readRegisters(REG_TEMP_OUT_H, buffer, 2);
    if (ret != ESP_OK) {
        return ret;
    }

    // Datasheet: Temp = raw / 340 + 36.53
    temp_c = be16(buffer) / 340.0f + 36.53f;
    return ESP_OK;
}

esp_err_t Mpu6050Imu::sleep() {
    esp_err_t ret = writeRegister(REG_PWR_MGMT_1, BIT_SLEEP);
    if (ret == ESP_OK) {
        sensor_initialized_ = false;
        ESP_LOGI(TAG, "Sensor asleep");
    }
    return ret;
}

bool Mpu6050Imu::isConnected() {
    uint8_t who_am_i = 0;
    if (readRegister(REG_WHO_AM_I, &who_am_i) != ESP_OK) {
        return false;
    }
    ESP_LOGD(TAG, "WHO_AM_I: 0x%02X", who_am_i);
    return who_am_i == WHO_AM_I_EXPECTED;
}

// ============================================================================
// I2C
// ============================================================================

esp_err_t Mpu6050Imu::initI2C() {
    i2c_config_t conf = {};
    conf.mode = I2C_MODE_MASTER;
    conf.sda_io_num = sda_pin_;
    conf.scl_io_num = scl_pin_;
    conf.sda_pullup_en = GPIO_PULLUP_ENABLE;
    conf.scl_pullup_en = GPIO_PULLUP_ENABLE;
    conf.master.clk_speed = i2c_freq_hz_;

    esp_err_t ret = i2c_param_config(i2c_port_, &conf);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "I2C param config failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = i2c_driver_install(i2c_port_, conf.mode, 0, 0, 0);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "I2C driver install failed: %s", esp_err_to_name(ret));
        return ret;
    }

    i2c_initialized_ = true;
    ESP_LOGI(TAG, "I2C%d at %lu Hz (SDA=%d, SCL=%d)", i2c_port_,
             static_cast<unsigned long>(i2c_freq_hz_), sda_pin_, scl_pin_);
    return ESP_OK;
}

esp_err_t Mpu6050Imu::writeRegister(uint8_t reg, uint8_t value) {
    uint8_t payload[2] = {reg, value};
    esp_err_t ret = i2c_master_write_to_device(i2c_port_, device_addr_, payload, sizeof(payload),
                                               pdMS_TO_TICKS(100));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Write reg 0x%02X failed: %s", reg, esp_err_to_name(ret));
    }
    return ret;
}

esp_err_t Mpu6050Imu::readRegister(uint8_t reg, uint8_t* value) {
    return readRegisters(reg, value, 1);
}

esp_err_t Mpu6050Imu::readRegisters(uint8_t reg, uint8_t* buffer, size_t length) {
    esp_err_t ret = i2c_master_write_read_device(i2c_port_, device_addr_, &reg, 1,
                                                 buffer, length, pdMS_TO_TICKS(100));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Read reg 0x%02X failed: %s", reg, esp_err_to_name(ret));
    }
    return ret;
}

}  // namespace pdi
