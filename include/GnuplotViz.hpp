#ifndef GNUPLOT_VIZ_HPP
#define GNUPLOT_VIZ_HPP

#include <vector>
#include <string>
#include <map>

namespace SWCS {

/**
 * @brief Plotting through generated gnuplot scripts
 *
 * Each plot leaves <name>.dat, <name>.gp and <name>.png in the output
 * directory, so a figure can be regenerated or restyled by hand.
 * Supports:
 * - Colormaps (jet, viridis, plasma, coolwarm)
 * - 2D cell fields with point markers (tide gauges)
 * - Time-series line plots
 */
class GnuplotViz {
public:
    GnuplotViz(const std::string& output_dir = "output");
    ~GnuplotViz();

    /**
     * @brief Colour map of a cell field, data[j][i]
     *
     * vmin == vmax == 0 selects the range from the data.
     * @return false if gnuplot could not render the script
     * @throws std::runtime_error if the data or script cannot be written
     */
    bool plot2DField(const std::vector<std::vector<double>>& data,
                     double x0, double y0, double Lx, double Ly,
                     const std::string& title,
                     const std::string& xlabel,
                     const std::string& ylabel,
                     const std::string& cblabel,
                     const std::string& colormap,
                     const std::string& filename,
                     double vmin = 0.0, double vmax = 0.0);

    // Markers drawn on the next 2D field plot
    struct PointMarker {
        double x, y;
        std::string label;
    };
    void addMarkers(const std::vector<PointMarker>& markers);

    /**
     * @brief One line per series against a shared x axis
     */
    bool plotLines(const std::vector<double>& x,
                   const std::map<std::string, std::vector<double>>& y_data,
                   const std::string& title,
                   const std::string& xlabel,
                   const std::string& ylabel,
                   const std::string& filename);

    // Only write .dat/.gp files when false (no gnuplot on the machine)
    void setRenderEnabled(bool enabled) { render_ = enabled; }

private:
    std::string output_dir_;
    std::vector<PointMarker> current_markers_;
    bool render_;

    void writeDataMatrix(const std::vector<std::vector<double>>& data,
                         double x0, double y0, double Lx, double Ly,
                         const std::string& filename);

    bool render(const std::string& script_name);

    std::string getPalette(const std::string& colormap);
};

} // namespace SWCS

#endif // GNUPLOT_VIZ_HPP
