#include "GnuplotViz.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <sys/stat.h>

namespace SWCS {

GnuplotViz::GnuplotViz(const std::string& output_dir)
    : output_dir_(output_dir), render_(true) {
    mkdir(output_dir_.c_str(), 0755);
}

GnuplotViz::~GnuplotViz() {}

std::string GnuplotViz::getPalette(const std::string& colormap) {
    if (colormap == "viridis") {
        return "defined ( 0 '#440154', 1 '#482475', 2 '#414487', 3 '#355f8d', 4 '#2a788e', 5 '#21918c', 6 '#22a884', 7 '#44bf70', 8 '#7ad151', 9 '#bddf26', 10 '#fde724' )";
    } else if (colormap == "plasma") {
        return "defined ( 0 '#0d0887', 1 '#41049d', 2 '#6a00a8', 3 '#8f0da4', 4 '#b12a90', 5 '#cc4778', 6 '#e16462', 7 '#f2844b', 8 '#fca636', 9 '#fcce25', 10 '#f0f921' )";
    } else if (colormap == "jet") {
        return "defined ( 0 '#000080', 1 '#0000ff', 2 '#0080ff', 3 '#00ffff', 4 '#80ff80', 5 '#ffff00', 6 '#ff8000', 7 '#ff0000', 8 '#800000' )";
    } else if (colormap == "coolwarm") {
        return "defined ( 0 '#3b4cc0', 1 '#7396f5', 2 '#b0d5f5', 3 '#edd1c2', 4 '#f7a789', 5 '#e36a53', 6 '#b40426' )";
    } else {
        // Default: parula-like
        return "defined ( 0 '#352a87', 1 '#0363e1', 2 '#1485d4', 3 '#06a7c6', 4 '#38b99e', 5 '#92bf73', 6 '#d9ba56', 7 '#fcce2e', 8 '#f9fb0e' )";
    }
}

void GnuplotViz::writeDataMatrix(const std::vector<std::vector<double>>& data,
                                 double x0, double y0, double Lx, double Ly,
                                 const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot write plot data: " + filename);
    }

    const int ny = static_cast<int>(data.size());
    const int nx = static_cast<int>(data[0].size());
    const double dx = Lx / nx;
    const double dy = Ly / ny;

    file << std::setprecision(10);

    // pm3d needs two scan lines; a single row is drawn across the full width
    if (ny == 1) {
        for (double y : {y0, y0 + Ly}) {
            for (int i = 0; i < nx; ++i) {
                file << x0 + (i + 0.5) * dx << " " << y << " " << data[0][i] << "\n";
            }
            file << "\n";
        }
        return;
    }

    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            double x = x0 + (i + 0.5) * dx;
            double y = y0 + (j + 0.5) * dy;
            file << x << " " << y << " " << data[j][i] << "\n";
        }
        file << "\n";  // Blank line for gnuplot matrix
    }
}

bool GnuplotViz::render(const std::string& script_name) {
    if (!render_) return true;

    std::string cmd = "cd '" + output_dir_ + "' && gnuplot " + script_name + " 2>/dev/null";
    int status = std::system(cmd.c_str());
    if (status != 0) {
        std::cerr << "Warning: gnuplot failed on " << output_dir_ << "/" << script_name
                  << " (exit status " << status << ")" << std::endl;
        return false;
    }
    return true;
}

bool GnuplotViz::plot2DField(const std::vector<std::vector<double>>& data,
                             double x0, double y0, double Lx, double Ly,
                             const std::string& title,
                             const std::string& xlabel,
                             const std::string& ylabel,
                             const std::string& cblabel,
                             const std::string& colormap,
                             const std::string& filename,
                             double vmin, double vmax) {
    if (data.empty() || data[0].empty()) {
        throw std::invalid_argument("plot2DField: empty field for " + filename);
    }

    writeDataMatrix(data, x0, y0, Lx, Ly, output_dir_ + "/" + filename + ".dat");

    // Auto-detect range if both are zero
    if (vmin == 0.0 && vmax == 0.0) {
        double dmin = 1e30, dmax = -1e30;
        for (const auto& row : data) {
            for (double val : row) {
                dmin = std::min(dmin, val);
                dmax = std::max(dmax, val);
            }
        }
        vmin = dmin;
        vmax = dmax;

        if (vmin == vmax) {
            if (std::abs(vmin) < 1e-10) {
                vmin = -1e-10;
                vmax = 1e-10;
            } else {
                double delta = std::abs(vmin) * 0.1;
                vmin -= delta;
                vmax += delta;
            }
        }
    }

    std::string script_file = output_dir_ + "/" + filename + ".gp";
    std::ofstream script(script_file);
    if (!script) {
        throw std::runtime_error("Cannot write gnuplot script: " + script_file);
    }

    script << "set terminal pngcairo size 1400,500 enhanced font 'Arial,14'\n";
    script << "set output '" << filename << ".png'\n\n";

    script << "set title '" << title << "' font 'Arial,16'\n";
    script << "set xlabel '" << xlabel << "' font 'Arial,14'\n";
    script << "set ylabel '" << ylabel << "' font 'Arial,14'\n";
    script << "set cblabel '" << cblabel << "' offset 2\n\n";

    script << "set pm3d map\n";
    script << "set palette " << getPalette(colormap) << "\n";
    script << "set cbrange [" << vmin << ":" << vmax << "]\n\n";

    script << "set xrange [" << x0 << ":" << x0 + Lx << "]\n";
    script << "set yrange [" << y0 << ":" << y0 + Ly << "]\n\n";

    script << "set style data pm3d\n";
    script << "set pm3d interpolate 0,0\n\n";

    for (const auto& m : current_markers_) {
        script << "set object circle at first " << m.x << "," << m.y
               << " radius char 0.5 front fillcolor rgb 'black' fillstyle solid\n";
        script << "set label '" << m.label << "' at " << m.x << "," << m.y
               << " front offset char 1,0.5 font 'Arial,12'\n";
    }

    script << "splot '" << filename << ".dat' using 1:2:3 notitle\n";
    script.close();

    current_markers_.clear();
    return render(filename + ".gp");
}

void GnuplotViz::addMarkers(const std::vector<PointMarker>& markers) {
    current_markers_ = markers;
}

bool GnuplotViz::plotLines(const std::vector<double>& x,
                           const std::map<std::string, std::vector<double>>& y_data,
                           const std::string& title,
                           const std::string& xlabel,
                           const std::string& ylabel,
                           const std::string& filename) {
    if (y_data.empty()) {
        throw std::invalid_argument("plotLines: no series for " + filename);
    }

    std::string data_file = output_dir_ + "/" + filename + ".dat";
    std::ofstream data(data_file);
    if (!data) {
        throw std::runtime_error("Cannot write plot data: " + data_file);
    }

    data << std::setprecision(10);
    for (size_t i = 0; i < x.size(); ++i) {
        data << x[i];
        for (const auto& pair : y_data) {
            if (i < pair.second.size()) {
                data << " " << pair.second[i];
            } else {
                data << " NaN";
            }
        }
        data << "\n";
    }
    data.close();

    std::string script_file = output_dir_ + "/" + filename + ".gp";
    std::ofstream script(script_file);
    if (!script) {
        throw std::runtime_error("Cannot write gnuplot script: " + script_file);
    }

    script << "set terminal pngcairo size 1200,700 enhanced font 'Arial,14'\n";
    script << "set output '" << filename << ".png'\n\n";

    script << "set title '" << title << "' font 'Arial,16'\n";
    script << "set xlabel '" << xlabel << "'\n";
    script << "set ylabel '" << ylabel << "'\n";
    script << "set grid\n";
    script << "set key outside right\n\n";

    script << "plot ";
    int col = 2;
    for (const auto& pair : y_data) {
        if (col > 2) script << ", \\\n     ";
        script << "'" << filename << ".dat' using 1:" << col
               << " with linespoints lw 2 pt 7 ps 0.5 title '" << pair.first << "'";
        col++;
    }
    script << "\n";
    script.close();

    return render(filename + ".gp");
}

} // namespace SWCS
