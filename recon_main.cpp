// =====================================================================================
//
//       Filename:  main
//
//    Description:  reconstructs financial statements from an SEC Financial Statement
//                  Data Set and checks them.
//
//      Inputs:
//
//        Version:  1.0
//        Created:  09/16/2026
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================
//


	/* This file is part of Statement_Recon. */

	/* Statement_Recon is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* Statement_Recon is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with Statement_Recon.  If not, see <http://www.gnu.org/licenses/>. */

#include <exception>
#include <iostream>

#include "spdlog/spdlog.h"

#include "StatementReconApp.h"

int main(int argc, char* argv[])
{
    auto result{0};

    try
    {
        StatementReconApp recon_app{argc, argv};

        if (! recon_app.Startup())
        {
            return 1;
        }

        auto [success_counter, skipped_counter, error_counter] = recon_app.Run();
        recon_app.Shutdown();

        if (error_counter > 0)
        {
            result = 2;
        }
    }
    catch (std::exception& e)
    {
        spdlog::error(e.what());
        std::cerr << e.what() << '\n';
        result = 1;
    }

    return result;

}        // -----  end of method main  -----
