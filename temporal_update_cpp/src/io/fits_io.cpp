#include "temporal_update/io/fits_io.hpp"
#include "temporal_update/core/errors.hpp"
#include "temporal_update/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <vector>

namespace temporal_update::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) return header;

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }
        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

} // namespace

std::pair<Matrix2Dd, FitsHeader> read_fits_matrix(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[2] = {0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 2, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 1 || naxis > 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS matrix must have 1 or 2 axes: " + path.string());
    }

    const long cols = naxes[0];
    const long rows = naxis == 2 ? naxes[1] : 1;
    const long n = rows * cols;

    Matrix2Dd data(rows, cols);
    long fpixel[2] = {1, 1};

    // Row-major storage matches the FITS axis order
    if (n > 0) {
        fits_read_pix(fptr, TDOUBLE, fpixel, n, nullptr, data.data(), nullptr, &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot read FITS pixel data: " + path.string());
        }
    }

    FitsHeader header = read_header(fptr);
    fits_close_file(fptr, &status);
    return {data, header};
}

VectorXd read_fits_vector(const fs::path& path) {
    auto [data, header] = read_fits_matrix(path);
    (void)header;
    if (data.rows() != 1 && data.cols() != 1) {
        throw FitsError("Expected a single row or column: " + path.string() + " is " +
                        std::to_string(data.rows()) + "x" + std::to_string(data.cols()));
    }
    return Eigen::Map<const VectorXd>(data.data(), data.size());
}

void write_fits_matrix(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, DOUBLE_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    if (data.size() > 0) {
        std::vector<double> buffer(data.data(), data.data() + data.size());
        long fpixel[2] = {1, 1};
        fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(buffer.size()), buffer.data(),
                       &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot write FITS pixel data: " + path.string());
        }
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

void write_fits_vector(const fs::path& path, const VectorXd& data, const FitsHeader& header) {
    Matrix2Dd row(1, data.size());
    row.row(0) = data.transpose();
    write_fits_matrix(path, row, header);
}

} // namespace temporal_update::io
