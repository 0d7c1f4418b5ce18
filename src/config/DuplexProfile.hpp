#pragma once

#include "DuplexConfig.hpp"

/**
 * Class:   DuplexProfile
 *
 * Description:
 *  - Giá trị mặc định tập trung cho một phiên full-duplex
 *  - Kiểm tra và sửa DuplexConfig trước khi DuplexController dùng
 */
class DuplexProfile
{
public:
    /// Default profile for a 16 kHz mono assistant
    static DuplexConfig defaults();

    /**
     * Clamp out-of-range values and normalize the language code.
     * Each correction is logged.
     *
     * @param cfg  config as supplied by the application
     * @return sanitized copy
     */
    static DuplexConfig sanitize(const DuplexConfig &cfg);

    /// "en-US" → "en", "auto"/"" → "en"
    static std::string normalizeLanguage(const std::string &lang);
};
